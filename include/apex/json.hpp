#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <apex/comparator.hpp>
#include <apex/detector.hpp>
#include <apex/metrics.hpp>
#include <apex/sample.hpp>
#include <apex/session.hpp>

namespace apex {

using Json = nlohmann::json;

// Missing values (NaN channels, empty optionals) are written as JSON null
// and read back as missing.
void to_json(Json& j, const Sample& s);
void from_json(const Json& j, Sample& s);

void to_json(Json& j, const CornerZone& z);
void from_json(const Json& j, CornerZone& z);

void to_json(Json& j, const CornerMetrics& m);
void from_json(const Json& j, CornerMetrics& m);

void to_json(Json& j, const MetricDeltas& d);
void from_json(const Json& j, MetricDeltas& d);

void to_json(Json& j, const ComparisonResult& r);
void from_json(const Json& j, ComparisonResult& r);

void to_json(Json& j, const DriverComparison& c);
void to_json(Json& j, const LapAnalysis& l);
void to_json(Json& j, const DriverAnalysis& d);
void to_json(Json& j, const RaceAnalysis& r);

// Telemetry document:
//   {"track": "barber", "race": 1, "drivers": {"7": [ {sample}, ... ], ...}}
// nullopt if the document is malformed.
std::optional<InMemoryTelemetrySource> telemetry_source_from_json(const Json& doc, RaceKey* key_out = nullptr);
std::optional<InMemoryTelemetrySource> load_telemetry_json(const std::string& path, RaceKey* key_out = nullptr);

Json telemetry_document(const RaceKey& key, const TelemetrySource& source);

} // namespace apex

#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <apex/comparator.hpp>
#include <apex/config.hpp>
#include <apex/detector.hpp>
#include <apex/lap.hpp>
#include <apex/metrics.hpp>
#include <apex/sample.hpp>

namespace apex {

// Identifies one imported race session.
struct RaceKey {
  std::string track;  // e.g. "barber"
  int race = 1;
  bool operator<(const RaceKey& o) const {
    return track != o.track ? track < o.track : race < o.race;
  }
};

// Loader boundary. Implementations must allow concurrent const calls.
class TelemetrySource {
public:
  virtual ~TelemetrySource() = default;
  virtual std::vector<std::string> drivers(const RaceKey& key) const = 0;
  // nullopt when the session or driver is unknown to the source.
  virtual std::optional<std::vector<Sample>> samples(const RaceKey& key,
                                                     const std::string& driver_id) const = 0;
};

class InMemoryTelemetrySource : public TelemetrySource {
public:
  void add(const RaceKey& key, const std::string& driver_id, std::vector<Sample> samples);

  std::vector<std::string> drivers(const RaceKey& key) const override;
  std::optional<std::vector<Sample>> samples(const RaceKey& key,
                                             const std::string& driver_id) const override;

private:
  std::map<RaceKey, std::map<std::string, std::vector<Sample>>> data_;
};

enum class LapStatus : int {
  Ok = 0,
  EmptyInput,     // no samples in the lap
  TooFewSamples,  // incomplete lap, below min_lap_samples
};

const char* lap_status_name(LapStatus s);

enum class AnalysisMode { BestLapOnly, AllLaps };

struct LapAnalysis {
  int lap_number = 0;
  double lap_time_s = 0.0;
  bool is_best_lap = false;
  std::size_t sample_count = 0;
  LapStatus status = LapStatus::Ok;
  std::vector<CornerMetrics> corners;  // each carries its CornerZone
};

struct DriverAnalysis {
  std::string driver_id;
  std::size_t skipped_samples = 0;
  std::size_t lap_count = 0;
  std::optional<int> best_lap_number;
  std::optional<double> best_lap_time_s;
  std::vector<LapAnalysis> laps;

  const LapAnalysis* best() const;
};

struct RaceAnalysis {
  RaceKey key{};
  std::vector<DriverAnalysis> drivers;       // in source driver order
  std::vector<std::string> failed_drivers;   // missing or empty sessions
  std::vector<std::string> failure_messages; // parallel to failed_drivers; "" when the source had no data
};

// Detection and extraction for one lap; never throws on bad data.
LapAnalysis analyze_lap(const Lap& lap, const AnalysisConfig& cfg);

// nullopt only for an empty session.
std::optional<DriverAnalysis> analyze_driver(const std::string& driver_id,
                                             const std::vector<Sample>& samples,
                                             const AnalysisConfig& cfg,
                                             AnalysisMode mode = AnalysisMode::BestLapOnly);

// Analyzes every driver of a session, spreading drivers over worker threads.
// A driver without usable data, or whose source call throws, is listed in
// failed_drivers; the rest continue.
RaceAnalysis analyze_race(const TelemetrySource& source,
                          const RaceKey& key,
                          const AnalysisConfig& cfg,
                          AnalysisMode mode = AnalysisMode::BestLapOnly,
                          std::size_t threads = 1);

// A driver's best lap with its samples and corner metrics, for plotting.
struct BestLap {
  Lap lap;
  std::vector<CornerMetrics> corners;
};

// nullopt for an empty session or when the best lap is incomplete.
std::optional<BestLap> best_lap_of(const std::string& driver_id,
                                   const std::vector<Sample>& samples,
                                   const AnalysisConfig& cfg);

const DriverAnalysis* find_driver(const RaceAnalysis& race, const std::string& driver_id);

// Compares the two drivers' best laps; nullopt when either has no analyzed best lap.
std::optional<DriverComparison> compare_best_laps(const DriverAnalysis& a,
                                                  const DriverAnalysis& b,
                                                  const ComparisonConfig& cfg);

} // namespace apex

#include <apex/json.hpp>
#include <fstream>

namespace apex {

namespace {

void put(Json& j, const char* key, const std::optional<double>& v) {
  if (v) j[key] = *v;
  else j[key] = nullptr;
}

// Number or NaN when missing/null.
double number_or_nan(const Json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return kNaN;
  return it->get<double>();
}

std::optional<double> optional_number(const Json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return std::nullopt;
  return it->get<double>();
}

} // namespace

void to_json(Json& j, const Sample& s) {
  // NaN doubles serialize as null
  j = Json{
    {"timestamp", s.timestamp},
    {"distance_m", s.distance_m},
    {"speed_kmh", s.speed_kmh},
    {"steering_deg", s.steering_deg},
    {"lateral_g", s.lateral_g},
    {"longitudinal_g", s.longitudinal_g},
    {"lap_number", s.lap_number},
  };
  put(j, "brake_front_bar", value_of(s.brake_front_bar));
  put(j, "throttle_pct", value_of(s.throttle_pct));
}

void from_json(const Json& j, Sample& s) {
  s.timestamp = number_or_nan(j, "timestamp");
  s.distance_m = number_or_nan(j, "distance_m");
  s.speed_kmh = number_or_nan(j, "speed_kmh");
  s.steering_deg = number_or_nan(j, "steering_deg");
  s.lateral_g = number_or_nan(j, "lateral_g");
  s.longitudinal_g = number_or_nan(j, "longitudinal_g");
  s.brake_front_bar = optional_number(j, "brake_front_bar");
  s.throttle_pct = optional_number(j, "throttle_pct");
  auto lap = j.find("lap_number");
  s.lap_number = (lap == j.end() || lap->is_null()) ? 0 : lap->get<int>();
}

void to_json(Json& j, const CornerZone& z) {
  j = Json{
    {"zone_index", z.zone_index},
    {"start_idx", z.start_idx},
    {"apex_idx", z.apex_idx},
    {"end_idx", z.end_idx},
    {"duration_s", z.duration_s},
  };
}

void from_json(const Json& j, CornerZone& z) {
  j.at("zone_index").get_to(z.zone_index);
  j.at("start_idx").get_to(z.start_idx);
  j.at("apex_idx").get_to(z.apex_idx);
  j.at("end_idx").get_to(z.end_idx);
  j.at("duration_s").get_to(z.duration_s);
}

void to_json(Json& j, const CornerMetrics& m) {
  j = Json{
    {"zone", m.zone},
    {"corner_time_s", m.corner_time_s},
    {"distance_start_m", m.distance_start_m},
    {"distance_apex_m", m.distance_apex_m},
    {"distance_exit_m", m.distance_exit_m},
  };
  put(j, "entry_speed_kmh", m.entry_speed_kmh);
  put(j, "apex_speed_kmh", m.apex_speed_kmh);
  put(j, "exit_speed_kmh", m.exit_speed_kmh);
  put(j, "lateral_g_max", m.lateral_g_max);
  put(j, "steering_smoothness", m.steering_smoothness);
  put(j, "steering_angle_max_deg", m.steering_angle_max_deg);
  put(j, "braking_point_distance_m", m.braking_point_distance_m);
  put(j, "brake_pressure_max_bar", m.brake_pressure_max_bar);
  put(j, "throttle_application_distance_m", m.throttle_application_distance_m);
}

void from_json(const Json& j, CornerMetrics& m) {
  j.at("zone").get_to(m.zone);
  j.at("corner_time_s").get_to(m.corner_time_s);
  m.distance_start_m = number_or_nan(j, "distance_start_m");
  m.distance_apex_m = number_or_nan(j, "distance_apex_m");
  m.distance_exit_m = number_or_nan(j, "distance_exit_m");
  m.entry_speed_kmh = optional_number(j, "entry_speed_kmh");
  m.apex_speed_kmh = optional_number(j, "apex_speed_kmh");
  m.exit_speed_kmh = optional_number(j, "exit_speed_kmh");
  m.lateral_g_max = optional_number(j, "lateral_g_max");
  m.steering_smoothness = optional_number(j, "steering_smoothness");
  m.steering_angle_max_deg = optional_number(j, "steering_angle_max_deg");
  m.braking_point_distance_m = optional_number(j, "braking_point_distance_m");
  m.brake_pressure_max_bar = optional_number(j, "brake_pressure_max_bar");
  m.throttle_application_distance_m = optional_number(j, "throttle_application_distance_m");
}

void to_json(Json& j, const MetricDeltas& d) {
  j = Json::object();
  for (Metric m : kAllMetrics) put(j, metric_key(m), d.get(m));
}

void from_json(const Json& j, MetricDeltas& d) {
  d.braking_point_m        = optional_number(j, metric_key(Metric::BrakingPoint));
  d.entry_speed_kmh        = optional_number(j, metric_key(Metric::EntrySpeed));
  d.apex_speed_kmh         = optional_number(j, metric_key(Metric::ApexSpeed));
  d.exit_speed_kmh         = optional_number(j, metric_key(Metric::ExitSpeed));
  d.corner_time_s          = j.at(metric_key(Metric::CornerTime)).get<double>();
  d.lateral_g_max          = optional_number(j, metric_key(Metric::LateralGMax));
  d.steering_smoothness    = optional_number(j, metric_key(Metric::SteeringSmoothness));
  d.steering_angle_max_deg = optional_number(j, metric_key(Metric::SteeringAngleMax));
  d.brake_pressure_max_bar = optional_number(j, metric_key(Metric::BrakePressureMax));
  d.throttle_application_m = optional_number(j, metric_key(Metric::ThrottleApplication));
}

void to_json(Json& j, const ComparisonResult& r) {
  j = Json{
    {"driver_a_id", r.driver_a_id},
    {"driver_b_id", r.driver_b_id},
    {"corner_index", r.corner_index},
    {"deltas", r.deltas},
    {"insights", r.insights},
  };
}

void from_json(const Json& j, ComparisonResult& r) {
  j.at("driver_a_id").get_to(r.driver_a_id);
  j.at("driver_b_id").get_to(r.driver_b_id);
  j.at("corner_index").get_to(r.corner_index);
  j.at("deltas").get_to(r.deltas);
  j.at("insights").get_to(r.insights);
}

void to_json(Json& j, const DriverComparison& c) {
  j = Json{
    {"driver_a_id", c.driver_a_id},
    {"driver_b_id", c.driver_b_id},
    {"corners", c.corners},
    {"expected_lap_time_gain_s", c.expected_lap_time_gain_s},
    {"expected_lap_time_gain_label", DriverComparison::kGainLabel},
    {"unmatched_corners_a", c.unmatched_a},
    {"unmatched_corners_b", c.unmatched_b},
  };
}

void to_json(Json& j, const LapAnalysis& l) {
  j = Json{
    {"lap_number", l.lap_number},
    {"lap_time_s", l.lap_time_s},
    {"is_best_lap", l.is_best_lap},
    {"sample_count", l.sample_count},
    {"status", lap_status_name(l.status)},
    {"corners", l.corners},
  };
}

void to_json(Json& j, const DriverAnalysis& d) {
  j = Json{
    {"driver_id", d.driver_id},
    {"skipped_samples", d.skipped_samples},
    {"lap_count", d.lap_count},
    {"laps", d.laps},
  };
  if (d.best_lap_number) j["best_lap_number"] = *d.best_lap_number;
  else j["best_lap_number"] = nullptr;
  put(j, "best_lap_time_s", d.best_lap_time_s);
}

void to_json(Json& j, const RaceAnalysis& r) {
  j = Json{
    {"track", r.key.track},
    {"race", r.key.race},
    {"drivers", r.drivers},
    {"failed_drivers", r.failed_drivers},
    {"failure_messages", r.failure_messages},
  };
}

std::optional<InMemoryTelemetrySource> telemetry_source_from_json(const Json& doc, RaceKey* key_out) {
  try {
    if (!doc.is_object()) return std::nullopt;
    RaceKey key;
    key.track = doc.value("track", std::string{});
    key.race = doc.value("race", 1);
    const auto it = doc.find("drivers");
    if (it == doc.end() || !it->is_object()) return std::nullopt;

    InMemoryTelemetrySource src;
    for (const auto& el : it->items()) {
      if (!el.value().is_array()) return std::nullopt;
      src.add(key, el.key(), el.value().get<std::vector<Sample>>());
    }
    if (key_out) *key_out = key;
    return src;
  } catch (const Json::exception&) {
    return std::nullopt;
  }
}

std::optional<InMemoryTelemetrySource> load_telemetry_json(const std::string& path, RaceKey* key_out) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  Json doc = Json::parse(f, nullptr, /*allow_exceptions*/ false);
  if (doc.is_discarded()) return std::nullopt;
  return telemetry_source_from_json(doc, key_out);
}

Json telemetry_document(const RaceKey& key, const TelemetrySource& source) {
  Json drivers = Json::object();
  for (const auto& id : source.drivers(key)) {
    if (auto s = source.samples(key, id); s.has_value()) drivers[id] = *s;
  }
  return Json{{"track", key.track}, {"race", key.race}, {"drivers", drivers}};
}

} // namespace apex

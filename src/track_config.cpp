#include <apex/track_config.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace apex {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
  // Simple CSV: no quoted fields.
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static constexpr std::size_t kColumns = 8;

static bool is_header_row(const std::vector<std::string>& cols) {
  if (cols.size() < kColumns) return false;
  return (cols[0] == "key" || cols[0] == "Key");
}

static std::optional<double> to_double(const std::string& s) {
  if (s.empty()) return std::nullopt;
  try {
    std::size_t idx = 0;
    const double v = std::stod(s, &idx);
    if (idx != s.size() || !std::isfinite(v)) return std::nullopt;
    return v;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static std::optional<TrackConfig> parse_track_row(const std::vector<std::string>& cols) {
  if (cols.size() < kColumns) return std::nullopt;
  const std::string key = cols[0];
  if (key.empty()) return std::nullopt;

  std::vector<double> v;
  v.reserve(kColumns - 1);
  for (std::size_t i = 1; i < kColumns; ++i) {
    auto d = to_double(cols[i]);
    if (!d || *d < 0.0) return std::nullopt;
    v.push_back(*d);
  }

  TrackConfig t;
  t.key = key;
  t.analysis.detection.steering_threshold_deg = v[0];
  t.analysis.detection.lateral_g_threshold = v[1];
  t.analysis.detection.min_corner_duration_s = v[2];
  t.analysis.detection.merge_gap_m = v[3];
  t.analysis.extraction.braking_lookback_samples = static_cast<std::size_t>(std::lround(v[4]));
  t.analysis.extraction.brake_pressure_threshold_bar = v[5];
  t.analysis.extraction.throttle_threshold_pct = v[6];
  return t;
}

static std::vector<TrackConfig> make_catalog_builtin() {
  auto entry = [](const char* key, const char* name) {
    return TrackConfig{key, name, AnalysisConfig{}};
  };
  return {
    entry("barber", "Barber Motorsports Park"),
    entry("cota", "Circuit of the Americas"),
    entry("roadamerica", "Road America"),
    entry("sonoma", "Sonoma Raceway"),
    entry("vir", "Virginia International Raceway"),
  };
}

const std::vector<TrackConfig>& track_config_catalog() {
  static const std::vector<TrackConfig> cat = make_catalog_builtin();
  return cat;
}

std::optional<TrackConfig> track_config_by_key(const std::string& key) {
  return track_config_by_key_in(track_config_catalog(), key);
}

std::optional<TrackConfig> track_config_by_key_in(const std::vector<TrackConfig>& cat,
                                                  const std::string& key) {
  auto it = std::find_if(cat.begin(), cat.end(), [&](const TrackConfig& t){ return t.key == key; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

AnalysisConfig analysis_config_for(const std::vector<TrackConfig>& cat, const std::string& key) {
  if (auto t = track_config_by_key_in(cat, key); t.has_value()) return t->analysis;
  return AnalysisConfig{};
}

ResolvedThresholds resolve_thresholds(const std::vector<TrackConfig>& cat,
                                      const std::string& session_track,
                                      const std::string& override_key) {
  ResolvedThresholds out;
  out.key = override_key.empty() ? session_track : override_key;
  if (auto t = track_config_by_key_in(cat, out.key); t.has_value()) {
    out.known = true;
    out.analysis = t->analysis;
  }
  return out;
}

std::vector<TrackConfig> track_config_catalog_from_csv_stream(std::istream& in) {
  std::vector<TrackConfig> out;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    std::string raw = trim(line);
    if (raw.empty()) continue;
    if (raw[0] == '#') continue;

    auto cols = split_csv_line(raw);

    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    if (auto row = parse_track_row(cols); row.has_value()) {
      out.push_back(*row);
    }
  }
  return out;
}

std::optional<std::vector<TrackConfig>> load_track_config_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return track_config_catalog_from_csv_stream(f);
}

} // namespace apex

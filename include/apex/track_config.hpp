#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <apex/config.hpp>

namespace apex {

// Per-track threshold overrides. Passed explicitly into every analysis call.
struct TrackConfig {
  std::string key;          // e.g., "barber"
  std::string name;         // display name (may be empty for CSV rows)
  AnalysisConfig analysis;
};

// Built-in catalog (default thresholds for the known circuits).
const std::vector<TrackConfig>& track_config_catalog();

// Lookup helpers
std::optional<TrackConfig> track_config_by_key(const std::string& key);
std::optional<TrackConfig> track_config_by_key_in(const std::vector<TrackConfig>& cat,
                                                  const std::string& key);

// Resolved config for a track: catalog entry if known, defaults otherwise.
AnalysisConfig analysis_config_for(const std::vector<TrackConfig>& cat, const std::string& key);

// Thresholds chosen for a session. Only picks the config; the session's own
// track key is still the one used to look up its telemetry.
struct ResolvedThresholds {
  std::string key;        // override_key when non-empty, else session_track
  bool known = false;     // key found in the catalog
  AnalysisConfig analysis;
};

ResolvedThresholds resolve_thresholds(const std::vector<TrackConfig>& cat,
                                      const std::string& session_track,
                                      const std::string& override_key);

// Stream-based CSV loader (test-friendly; no filesystem required).
// Columns: key,steering_threshold_deg,lateral_g_threshold,min_corner_duration_s,
//          merge_gap_m,braking_lookback_samples,brake_pressure_threshold_bar,throttle_threshold_pct
// Accepts an optional header row; ignores lines starting with '#' and blank lines.
// Whitespace around fields is trimmed. Invalid rows are skipped.
std::vector<TrackConfig> track_config_catalog_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<TrackConfig>> load_track_config_csv(const std::string& path);

} // namespace apex

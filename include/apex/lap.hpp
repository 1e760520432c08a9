#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <apex/sample.hpp>

namespace apex {

struct Lap {
  std::string driver_id;
  int lap_number = 0;
  std::vector<Sample> samples;  // ordered by timestamp
  double lap_time_s = 0.0;      // last.timestamp - first.timestamp
  bool is_best_lap = false;
};

struct LapSegmentation {
  std::vector<Lap> laps;            // ordered by lap_number
  std::size_t skipped_samples = 0;  // malformed samples dropped (NaN timestamp/distance)

  const Lap* best_lap() const;
  const Lap* lap_by_number(int lap_number) const;
};

// Group a driver's lap-tagged samples into laps and flag the fastest one.
// Only laps with at least min_lap_samples samples compete for best lap
// (all laps compete if none qualifies).
// Returns nullopt for an empty session (no samples, or none with a usable
// timestamp and distance).
std::optional<LapSegmentation> segment_laps(const std::string& driver_id,
                                            const std::vector<Sample>& samples,
                                            std::size_t min_lap_samples = 2);

} // namespace apex

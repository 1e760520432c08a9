#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include <apex/config.hpp>
#include <apex/lap.hpp>
#include <apex/sample.hpp>

namespace apex {

// Inclusive index range into a lap's samples.
struct IndexRange {
  std::size_t start = 0;
  std::size_t end = 0;
  std::size_t size() const { return end - start + 1; }
  bool operator==(const IndexRange&) const = default;
};

// A detected corner. zone_index is a per-lap ordinal, not an official corner number.
struct CornerZone {
  std::size_t zone_index = 0;
  std::size_t start_idx = 0;
  std::size_t apex_idx = 0;
  std::size_t end_idx = 0;
  double duration_s = 0.0;
  bool operator==(const CornerZone&) const = default;
};

// Per-sample threshold masks. Missing values never confirm cornering.
std::vector<bool> steering_mask(const std::vector<Sample>& samples, const DetectionConfig& cfg);
std::vector<bool> lateral_g_mask(const std::vector<Sample>& samples, const DetectionConfig& cfg);
std::vector<bool> corner_mask(const std::vector<Sample>& samples, const DetectionConfig& cfg);

// Maximal runs of consecutive true values.
std::vector<IndexRange> find_runs(const std::vector<bool>& mask);

// Drops runs shorter than min_duration_s (by timestamp) or with fewer than 2 samples.
std::vector<IndexRange> filter_by_duration(const std::vector<Sample>& samples,
                                           const std::vector<IndexRange>& runs,
                                           double min_duration_s);

// Merges neighbours whose distance gap (next.start - prev.end) is below merge_gap_m.
// Closely spaced chicane sub-corners collapse into one range.
std::vector<IndexRange> merge_nearby(const std::vector<Sample>& samples,
                                     const std::vector<IndexRange>& runs,
                                     double merge_gap_m);

// Index of the minimum non-NaN speed within range; nullopt if every speed is missing.
std::optional<std::size_t> argmin_speed(const std::vector<Sample>& samples, const IndexRange& range);

// Full pipeline: masks -> runs -> duration filter -> merge -> apex -> zone_index.
// An empty result is a valid answer (e.g. no sample passes both thresholds).
std::vector<CornerZone> detect_corners(const std::vector<Sample>& samples, const DetectionConfig& cfg);

inline std::vector<CornerZone> detect_corners(const Lap& lap, const DetectionConfig& cfg) {
  return detect_corners(lap.samples, cfg);
}

} // namespace apex

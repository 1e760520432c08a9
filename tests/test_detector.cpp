#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <vector>

#include <apex/detector.hpp>
#include "telemetry_fixtures.hpp"

using Catch::Approx;
using namespace apex;
using apex::testing::ramp_corner_lap;
using apex::testing::straight_lap;

static Sample at(double t, double d, double steer, double lat, double speed) {
  Sample s;
  s.timestamp = t;
  s.distance_m = d;
  s.steering_deg = steer;
  s.lateral_g = lat;
  s.speed_kmh = speed;
  return s;
}

TEST_CASE("corner_mask is the AND of steering and lateral g masks") {
  const DetectionConfig cfg{};
  std::vector<Sample> s = {
    at(0.0, 0.0, 45.0, 1.2, 100.0),    // both
    at(0.1, 1.0, 45.0, 0.2, 100.0),    // steering only
    at(0.2, 2.0, 5.0, 1.2, 100.0),     // lateral only
    at(0.3, 3.0, -45.0, -1.2, 100.0),  // both, right-hand
    at(0.4, 4.0, kNaN, 1.2, 100.0),    // missing steering
    at(0.5, 5.0, 30.0, 0.8, 100.0),    // exactly at threshold
  };
  const auto steer = steering_mask(s, cfg);
  const auto lat = lateral_g_mask(s, cfg);
  const auto both = corner_mask(s, cfg);
  REQUIRE(both.size() == s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    REQUIRE(both[i] == (steer[i] && lat[i]));
  }
  REQUIRE(both == std::vector<bool>{true, false, false, true, false, false});
}

TEST_CASE("find_runs returns maximal runs including trailing run") {
  REQUIRE(find_runs({}).empty());
  REQUIRE(find_runs({false, false}).empty());
  const auto runs = find_runs({true, true, false, true, false, false, true, true, true});
  REQUIRE(runs.size() == 3);
  REQUIRE(runs[0] == IndexRange{0, 1});
  REQUIRE(runs[1] == IndexRange{3, 3});
  REQUIRE(runs[2] == IndexRange{6, 8});
}

TEST_CASE("filter_by_duration drops short and single-sample runs") {
  std::vector<Sample> s;
  for (int i = 0; i < 40; ++i) s.push_back(at(i * 0.1, i * 2.0, 45.0, 1.2, 100.0));
  const std::vector<IndexRange> runs = {{0, 0}, {2, 5}, {10, 20}};
  const auto kept = filter_by_duration(s, runs, 0.5);
  REQUIRE(kept.size() == 1);
  REQUIRE(kept[0] == IndexRange{10, 20});
}

TEST_CASE("merge_nearby joins runs closer than the gap and is idempotent") {
  std::vector<Sample> s;
  for (int i = 0; i < 100; ++i) s.push_back(at(i * 0.1, i * 5.0, 0.0, 0.0, 100.0));
  // Gaps: 20..30 -> 35..45 is 25 m, 45 -> 80 is 175 m
  const std::vector<IndexRange> runs = {{20, 30}, {35, 45}, {80, 90}};
  const auto merged = merge_nearby(s, runs, 50.0);
  REQUIRE(merged.size() == 2);
  REQUIRE(merged[0] == IndexRange{20, 45});
  REQUIRE(merged[1] == IndexRange{80, 90});
  REQUIRE(merge_nearby(s, merged, 50.0) == merged);

  SECTION("gap equal to the threshold keeps runs apart") {
    const auto apart = merge_nearby(s, {{20, 30}, {40, 45}}, 50.0);
    REQUIRE(apart.size() == 2);
  }
}

TEST_CASE("argmin_speed skips missing speeds") {
  std::vector<Sample> s = {
    at(0.0, 0.0, 0, 0, 120.0),
    at(0.1, 1.0, 0, 0, kNaN),
    at(0.2, 2.0, 0, 0, 95.0),
    at(0.3, 3.0, 0, 0, 101.0),
  };
  REQUIRE(argmin_speed(s, {0, 3}).value() == 2);
  REQUIRE(argmin_speed(s, {1, 1}) == std::nullopt);
}

TEST_CASE("detect_corners finds the ramp corner with its apex") {
  const auto lap = ramp_corner_lap();
  const auto zones = detect_corners(lap, DetectionConfig{});
  REQUIRE(zones.size() == 1);
  const auto& z = zones[0];
  REQUIRE(z.zone_index == 0);
  REQUIRE(lap[z.start_idx].distance_m == Approx(100.0).margin(10.0));
  REQUIRE(lap[z.end_idx].distance_m == Approx(250.0).margin(10.0));
  REQUIRE(lap[z.apex_idx].distance_m == Approx(180.0));
  REQUIRE(z.duration_s == Approx(lap[z.end_idx].timestamp - lap[z.start_idx].timestamp));
}

TEST_CASE("detect_corners returns an empty list on a straight") {
  REQUIRE(detect_corners(straight_lap(), DetectionConfig{}).empty());
  REQUIRE(detect_corners(std::vector<Sample>{}, DetectionConfig{}).empty());
}

TEST_CASE("detect_corners zones are ordered, disjoint and apex is the minimum speed") {
  // Two ramp corners 400 m apart with noise-free speeds, one with a missing speed at the apex
  auto lap = ramp_corner_lap();
  auto second = ramp_corner_lap();
  for (auto& s : second) {
    s.distance_m += 401.0;
    s.timestamp += 401.0 * 0.05;
  }
  second[180].speed_kmh = kNaN;
  lap.insert(lap.end(), second.begin(), second.end());

  const auto zones = detect_corners(lap, DetectionConfig{});
  REQUIRE(zones.size() == 2);
  for (std::size_t k = 0; k < zones.size(); ++k) {
    const auto& z = zones[k];
    REQUIRE(z.zone_index == k);
    REQUIRE(z.start_idx <= z.apex_idx);
    REQUIRE(z.apex_idx <= z.end_idx);
    for (std::size_t i = z.start_idx; i <= z.end_idx; ++i) {
      if (present(lap[i].speed_kmh)) REQUIRE(lap[z.apex_idx].speed_kmh <= lap[i].speed_kmh);
    }
    if (k > 0) REQUIRE(zones[k-1].end_idx < z.start_idx);
  }
  REQUIRE(present(lap[zones[1].apex_idx].speed_kmh));
}

TEST_CASE("lowering a channel outside a zone never creates a zone") {
  auto lap = ramp_corner_lap();
  const auto before = detect_corners(lap, DetectionConfig{});
  REQUIRE(before.size() == 1);
  // High steering but low lateral g on the straight after the corner
  for (std::size_t i = 300; i < 340; ++i) {
    lap[i].steering_deg = 60.0;
    lap[i].lateral_g = 0.3;
  }
  REQUIRE(detect_corners(lap, DetectionConfig{}) == before);
}

TEST_CASE("missing lateral g never confirms a corner") {
  auto lap = ramp_corner_lap();
  for (auto& s : lap) s.lateral_g = kNaN;
  REQUIRE(detect_corners(lap, DetectionConfig{}).empty());
}

TEST_CASE("apex falls back to the zone start when every speed is missing") {
  auto lap = ramp_corner_lap();
  for (auto& s : lap) s.speed_kmh = kNaN;
  const auto zones = detect_corners(lap, DetectionConfig{});
  REQUIRE(zones.size() == 1);
  REQUIRE(zones[0].apex_idx == zones[0].start_idx);
}

TEST_CASE("chicane sub-corners within the merge gap become one zone") {
  // Left then right, 20 m apart
  std::vector<Sample> s;
  for (int i = 0; i < 300; ++i) {
    const double d = double(i);
    double steer = 0.0, lat = 0.0;
    if (d >= 100 && d < 130) { steer = 40.0; lat = 1.0; }
    if (d >= 150 && d < 180) { steer = -40.0; lat = -1.0; }
    s.push_back(at(d * 0.05, d, steer, lat, 120.0 - std::abs(d - 140.0) * 0.1));
  }
  auto zones = detect_corners(s, DetectionConfig{});
  REQUIRE(zones.size() == 1);
  REQUIRE(zones[0].start_idx == 100);
  REQUIRE(zones[0].end_idx == 179);

  DetectionConfig tight{};
  tight.merge_gap_m = 10.0;
  zones = detect_corners(s, tight);
  REQUIRE(zones.size() == 2);
  REQUIRE(zones[1].zone_index == 1);
}

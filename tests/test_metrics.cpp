#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <apex/metrics.hpp>
#include "telemetry_fixtures.hpp"

using Catch::Approx;
using namespace apex;
using apex::testing::RampCorner;
using apex::testing::ramp_corner_lap;

static CornerZone only_zone(const std::vector<Sample>& lap) {
  const auto zones = detect_corners(lap, DetectionConfig{});
  REQUIRE(zones.size() == 1);
  return zones[0];
}

TEST_CASE("aggregations skip NaN and report all-missing as nullopt") {
  REQUIRE(max_abs({1.0, -3.0, kNaN, 2.0}).value() == Approx(3.0));
  REQUIRE(max_abs({kNaN, kNaN}) == std::nullopt);
  REQUIRE(max_abs({}) == std::nullopt);

  REQUIRE(population_stddev({2.0, 4.0, kNaN, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}).value() == Approx(2.0));
  REQUIRE(population_stddev({5.0}).value() == Approx(0.0));
  REQUIRE(population_stddev({kNaN}) == std::nullopt);
}

TEST_CASE("braking_window must fit inside the lap") {
  REQUIRE(braking_window(150, 100).value() == IndexRange{50, 149});
  REQUIRE(braking_window(100, 100).value() == IndexRange{0, 99});
  REQUIRE(braking_window(30, 100) == std::nullopt);
  REQUIRE(braking_window(0, 100) == std::nullopt);
  REQUIRE(braking_window(10, 0) == std::nullopt);
}

TEST_CASE("clipped_braking_window stops at the lap start") {
  REQUIRE(clipped_braking_window(150, 100).value() == IndexRange{50, 149});
  REQUIRE(clipped_braking_window(30, 100).value() == IndexRange{0, 29});
  REQUIRE(clipped_braking_window(0, 100) == std::nullopt);
}

TEST_CASE("corner close to the lap start keeps its peak brake pressure") {
  // Drop the first 20 m: the zone now starts 84 samples in, braking sits at 40..79
  auto full = ramp_corner_lap();
  const std::vector<Sample> lap(full.begin() + 20, full.end());
  const auto zone = only_zone(lap);
  REQUIRE(zone.start_idx == 84);

  const auto m = extract_corner_metrics(lap, zone, ExtractionConfig{});
  REQUIRE(m.braking_point_distance_m == std::nullopt);
  REQUIRE(m.brake_pressure_max_bar.value() == Approx(30.0));
  REQUIRE(m.apex_speed_kmh.has_value());
}

TEST_CASE("extract_corner_metrics on the ramp corner") {
  const auto lap = ramp_corner_lap();
  const auto zone = only_zone(lap);
  const auto m = extract_corner_metrics(lap, zone, ExtractionConfig{});

  REQUIRE(m.zone == zone);
  REQUIRE(m.braking_point_distance_m.value() == Approx(60.0));
  REQUIRE(m.brake_pressure_max_bar.value() == Approx(30.0));
  REQUIRE(m.apex_speed_kmh.value() == Approx(90.0));
  REQUIRE(m.distance_apex_m == Approx(180.0));
  REQUIRE(m.entry_speed_kmh.value() == Approx(lap[zone.start_idx].speed_kmh));
  REQUIRE(m.exit_speed_kmh.value() == Approx(lap[zone.end_idx].speed_kmh));
  REQUIRE(m.corner_time_s == Approx(zone.duration_s));
  REQUIRE(m.lateral_g_max.value() == Approx(1.2));
  REQUIRE(m.steering_angle_max_deg.value() == Approx(45.0));
  REQUIRE(m.steering_smoothness.value() > 0.0);
  REQUIRE(m.throttle_application_distance_m.value() == Approx(200.0));
  REQUIRE(m.distance_start_m == Approx(lap[zone.start_idx].distance_m));
  REQUIRE(m.distance_exit_m == Approx(lap[zone.end_idx].distance_m));
}

TEST_CASE("braking point uses the first sample inside the lookback window") {
  const auto lap = ramp_corner_lap(1, 0.0, RampCorner{.brake_from_m = 20.0});
  const auto zone = only_zone(lap);

  SECTION("window reaches back far enough") {
    REQUIRE(extract_corner_metrics(lap, zone, ExtractionConfig{}).braking_point_distance_m.value() == Approx(20.0));
  }
  SECTION("short lookback starts the scan mid-braking") {
    ExtractionConfig cfg{};
    cfg.braking_lookback_samples = 30;
    const auto m = extract_corner_metrics(lap, zone, cfg);
    REQUIRE(m.braking_point_distance_m.value() == Approx(lap[zone.start_idx - 30].distance_m));
  }
}

TEST_CASE("lift-off corner has no braking point") {
  auto lap = ramp_corner_lap();
  for (auto& s : lap) s.brake_front_bar = 5.0;
  const auto m = extract_corner_metrics(lap, only_zone(lap), ExtractionConfig{});
  REQUIRE(m.braking_point_distance_m == std::nullopt);
  REQUIRE(m.brake_pressure_max_bar.value() == Approx(5.0));
}

TEST_CASE("missing channels degrade to nullopt without touching other metrics") {
  const auto lap = ramp_corner_lap(1, 0.0, RampCorner{.with_brake = false, .with_throttle = false});
  const auto m = extract_corner_metrics(lap, only_zone(lap), ExtractionConfig{});
  REQUIRE(m.braking_point_distance_m == std::nullopt);
  REQUIRE(m.brake_pressure_max_bar == std::nullopt);
  REQUIRE(m.throttle_application_distance_m == std::nullopt);
  REQUIRE(m.apex_speed_kmh.value() == Approx(90.0));

  SECTION("NaN stored in an optional channel counts as missing") {
    auto nan_lap = ramp_corner_lap();
    for (auto& s : nan_lap) s.brake_front_bar = kNaN;
    const auto n = extract_corner_metrics(nan_lap, only_zone(nan_lap), ExtractionConfig{});
    REQUIRE(n.brake_pressure_max_bar == std::nullopt);
  }
}

TEST_CASE("throttle overrun extends the scan past the zone exit") {
  const auto lap = ramp_corner_lap(1, 0.0, RampCorner{.throttle_from_m = 260.0});
  const auto zone = only_zone(lap);
  REQUIRE(extract_corner_metrics(lap, zone, ExtractionConfig{}).throttle_application_distance_m == std::nullopt);

  ExtractionConfig cfg{};
  cfg.throttle_overrun_samples = 20;
  REQUIRE(extract_corner_metrics(lap, zone, cfg).throttle_application_distance_m.value() == Approx(260.0));
}

TEST_CASE("out-of-range zone yields empty metrics") {
  const auto lap = ramp_corner_lap();
  CornerZone bogus{.zone_index = 0, .start_idx = 390, .apex_idx = 395, .end_idx = 900, .duration_s = 1.0};
  const auto m = extract_corner_metrics(lap, bogus, ExtractionConfig{});
  REQUIRE(m.apex_speed_kmh == std::nullopt);
  REQUIRE(m.braking_point_distance_m == std::nullopt);
}

TEST_CASE("extract_all_metrics keeps zone order") {
  Lap lap;
  lap.samples = ramp_corner_lap();
  const auto zones = detect_corners(lap, DetectionConfig{});
  const auto all = extract_all_metrics(lap, zones, ExtractionConfig{});
  REQUIRE(all.size() == zones.size());
  REQUIRE(all[0].zone == zones[0]);
}

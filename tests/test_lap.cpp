#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <apex/lap.hpp>
#include "telemetry_fixtures.hpp"

using Catch::Approx;
using namespace apex;
using apex::testing::straight_lap;

static Sample tagged(int lap, double t, double d) {
  Sample s;
  s.timestamp = t;
  s.distance_m = d;
  s.speed_kmh = 100.0;
  s.lap_number = lap;
  return s;
}

TEST_CASE("segment_laps groups by lap number and orders by timestamp") {
  std::vector<Sample> in = {
    tagged(2, 11.0, 5.0), tagged(1, 0.5, 5.0), tagged(1, 0.0, 0.0),
    tagged(2, 10.0, 0.0), tagged(1, 1.0, 10.0), tagged(2, 12.5, 10.0),
  };
  const auto seg = segment_laps("44", in);
  REQUIRE(seg.has_value());
  REQUIRE(seg->laps.size() == 2);
  REQUIRE(seg->skipped_samples == 0);

  const Lap& l1 = seg->laps[0];
  REQUIRE(l1.driver_id == "44");
  REQUIRE(l1.lap_number == 1);
  REQUIRE(l1.samples.size() == 3);
  REQUIRE(l1.samples[0].timestamp == Approx(0.0));
  REQUIRE(l1.samples[2].timestamp == Approx(1.0));
  REQUIRE(l1.lap_time_s == Approx(1.0));
  REQUIRE(l1.is_best_lap);

  const Lap& l2 = seg->laps[1];
  REQUIRE(l2.lap_time_s == Approx(2.5));
  REQUIRE_FALSE(l2.is_best_lap);
  REQUIRE(seg->best_lap() == &l1);
  REQUIRE(seg->lap_by_number(2) == &l2);
  REQUIRE(seg->lap_by_number(3) == nullptr);
}

TEST_CASE("malformed samples are dropped and counted") {
  std::vector<Sample> in = {
    tagged(1, 0.0, 0.0), tagged(1, kNaN, 1.0), tagged(1, 0.2, kNaN), tagged(1, 0.3, 3.0),
  };
  const auto seg = segment_laps("1", in);
  REQUIRE(seg.has_value());
  REQUIRE(seg->skipped_samples == 2);
  REQUIRE(seg->laps.size() == 1);
  REQUIRE(seg->laps[0].samples.size() == 2);
}

TEST_CASE("empty sessions are rejected") {
  REQUIRE_FALSE(segment_laps("1", {}).has_value());
  REQUIRE_FALSE(segment_laps("1", {tagged(1, kNaN, kNaN), tagged(2, 1.0, kNaN)}).has_value());
}

TEST_CASE("incomplete laps do not compete for best lap") {
  auto in = straight_lap(1, 0.0, 200);           // 9.95 s
  auto out_lap = straight_lap(2, 20.0, 10);      // 0.45 s, incomplete
  in.insert(in.end(), out_lap.begin(), out_lap.end());

  const auto seg = segment_laps("9", in, 50);
  REQUIRE(seg.has_value());
  REQUIRE(seg->best_lap()->lap_number == 1);

  SECTION("without a minimum the shortest lap wins") {
    const auto any = segment_laps("9", in, 2);
    REQUIRE(any->best_lap()->lap_number == 2);
  }
  SECTION("when no lap is complete all laps compete") {
    const auto none = segment_laps("9", out_lap, 50);
    REQUIRE(none->best_lap()->lap_number == 2);
  }
}

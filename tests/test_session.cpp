#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <apex/session.hpp>
#include <apex/track_config.hpp>
#include "telemetry_fixtures.hpp"

using Catch::Approx;
using namespace apex;
using apex::testing::RampCorner;
using apex::testing::ramp_corner_lap;

static std::vector<Sample> two_laps(const RampCorner& c, double second_lap_slowdown_s) {
  auto laps = ramp_corner_lap(1, 0.0, c);
  auto slow = ramp_corner_lap(2, 30.0, c);
  for (std::size_t i = 0; i < slow.size(); ++i) slow[i].timestamp += second_lap_slowdown_s * double(i) / double(slow.size());
  laps.insert(laps.end(), slow.begin(), slow.end());
  return laps;
}

static const RaceKey kKey{.track = "barber", .race = 1};

static InMemoryTelemetrySource make_source() {
  InMemoryTelemetrySource src;
  src.add(kKey, "13", two_laps(RampCorner{.brake_from_m = 80.0, .speed_offset_kmh = 3.0}, 1.0));
  src.add(kKey, "7", two_laps(RampCorner{}, 1.0));
  src.add(kKey, "99", {});
  return src;
}

TEST_CASE("InMemoryTelemetrySource lists drivers and rejects unknown keys") {
  const auto src = make_source();
  REQUIRE(src.drivers(kKey) == std::vector<std::string>{"13", "7", "99"});
  REQUIRE(src.drivers(RaceKey{.track = "cota", .race = 1}).empty());
  REQUIRE_FALSE(src.samples(kKey, "42").has_value());
  REQUIRE(src.samples(kKey, "7")->size() == 802);
}

TEST_CASE("analyze_lap reports incomplete laps instead of analyzing them") {
  Lap lap;
  lap.lap_number = 4;
  REQUIRE(analyze_lap(lap, AnalysisConfig{}).status == LapStatus::EmptyInput);

  auto samples = ramp_corner_lap();
  samples.resize(30);
  lap.samples = samples;
  const auto res = analyze_lap(lap, AnalysisConfig{});
  REQUIRE(res.status == LapStatus::TooFewSamples);
  REQUIRE(res.corners.empty());
  REQUIRE(std::string(lap_status_name(res.status)) == "too_few_samples");
}

TEST_CASE("analyze_driver in best-lap and all-laps modes") {
  const auto samples = two_laps(RampCorner{}, 1.0);

  const auto best = analyze_driver("7", samples, AnalysisConfig{});
  REQUIRE(best.has_value());
  REQUIRE(best->lap_count == 2);
  REQUIRE(best->laps.size() == 1);
  REQUIRE(best->best_lap_number.value() == 1);
  REQUIRE(best->best_lap_time_s.value() == Approx(20.0));
  REQUIRE(best->best() != nullptr);
  REQUIRE(best->best()->corners.size() == 1);

  const auto all = analyze_driver("7", samples, AnalysisConfig{}, AnalysisMode::AllLaps);
  REQUIRE(all->laps.size() == 2);
  REQUIRE(all->laps[1].status == LapStatus::Ok);
  REQUIRE(all->laps[1].corners.size() == 1);

  REQUIRE_FALSE(analyze_driver("7", {}, AnalysisConfig{}).has_value());
}

TEST_CASE("analyze_race isolates drivers without data") {
  const auto src = make_source();
  const auto race = analyze_race(src, kKey, AnalysisConfig{});
  REQUIRE(race.key.track == "barber");
  REQUIRE(race.drivers.size() == 2);
  REQUIRE(race.failed_drivers == std::vector<std::string>{"99"});
  REQUIRE(race.failure_messages == std::vector<std::string>{""});
  REQUIRE(find_driver(race, "7") != nullptr);
  REQUIRE(find_driver(race, "99") == nullptr);
}

TEST_CASE("analyze_race gives the same answer on several threads") {
  const auto src = make_source();
  const auto serial = analyze_race(src, kKey, AnalysisConfig{}, AnalysisMode::AllLaps, 1);
  const auto parallel = analyze_race(src, kKey, AnalysisConfig{}, AnalysisMode::AllLaps, 4);
  REQUIRE(serial.drivers.size() == parallel.drivers.size());
  for (std::size_t i = 0; i < serial.drivers.size(); ++i) {
    const auto& s = serial.drivers[i];
    const auto& p = parallel.drivers[i];
    REQUIRE(s.driver_id == p.driver_id);
    REQUIRE(s.laps.size() == p.laps.size());
    for (std::size_t l = 0; l < s.laps.size(); ++l) {
      REQUIRE(s.laps[l].corners.size() == p.laps[l].corners.size());
      for (std::size_t k = 0; k < s.laps[l].corners.size(); ++k) {
        REQUIRE(s.laps[l].corners[k].zone == p.laps[l].corners[k].zone);
      }
    }
  }
  REQUIRE(serial.failed_drivers == parallel.failed_drivers);
}

// Loader whose read fails for one driver.
class FailingSource : public InMemoryTelemetrySource {
public:
  explicit FailingSource(std::string broken) : broken_(std::move(broken)) {}
  std::optional<std::vector<Sample>> samples(const RaceKey& key,
                                             const std::string& driver_id) const override {
    if (driver_id == broken_) throw std::runtime_error("corrupt telemetry file");
    return InMemoryTelemetrySource::samples(key, driver_id);
  }
private:
  std::string broken_;
};

TEST_CASE("analyze_race survives a source that throws for one driver") {
  FailingSource src("21");
  src.add(kKey, "7", two_laps(RampCorner{}, 1.0));
  src.add(kKey, "13", two_laps(RampCorner{.brake_from_m = 80.0}, 1.0));
  src.add(kKey, "21", two_laps(RampCorner{}, 0.5));
  src.add(kKey, "44", two_laps(RampCorner{}, 2.0));

  for (std::size_t threads : {1u, 4u}) {
    const auto race = analyze_race(src, kKey, AnalysisConfig{}, AnalysisMode::BestLapOnly, threads);
    REQUIRE(race.drivers.size() == 3);
    REQUIRE(find_driver(race, "44") != nullptr);
    REQUIRE(race.failed_drivers == std::vector<std::string>{"21"});
    REQUIRE(race.failure_messages == std::vector<std::string>{"corrupt telemetry file"});
  }
}

TEST_CASE("track threshold override keeps the session key for data lookup") {
  TrackConfig sonoma{.key = "sonoma", .name = "Sonoma Raceway", .analysis = {}};
  sonoma.analysis.detection.merge_gap_m = 60.0;
  const std::vector<TrackConfig> cat{sonoma};

  const auto src = make_source();
  const auto chosen = resolve_thresholds(cat, kKey.track, "sonoma");
  REQUIRE(chosen.known);
  REQUIRE(chosen.key == "sonoma");
  REQUIRE(chosen.analysis.detection.merge_gap_m == Approx(60.0));

  const auto race = analyze_race(src, kKey, chosen.analysis);
  REQUIRE(race.key.track == "barber");
  REQUIRE(race.drivers.size() == 2);
  REQUIRE(find_driver(race, "7")->best()->corners.size() == 1);
}

TEST_CASE("compare_best_laps compares the two best laps") {
  const auto src = make_source();
  const auto race = analyze_race(src, kKey, AnalysisConfig{}, AnalysisMode::BestLapOnly, 2);
  const auto cmp = compare_best_laps(*find_driver(race, "7"), *find_driver(race, "13"), AnalysisConfig{}.comparison);
  REQUIRE(cmp.has_value());
  REQUIRE(cmp->corners.size() == 1);
  const auto& c = cmp->corners[0];
  REQUIRE(c.deltas.braking_point_m.value() == Approx(20.0));
  REQUIRE(c.deltas.entry_speed_kmh.value() == Approx(3.0));
  REQUIRE_FALSE(c.insights.empty());
  REQUIRE(c.insights[0].find("later") != std::string::npos);

  DriverAnalysis empty;
  empty.driver_id = "x";
  REQUIRE_FALSE(compare_best_laps(*find_driver(race, "7"), empty, AnalysisConfig{}.comparison).has_value());
}

TEST_CASE("best_lap_of returns the best lap with its corners") {
  const auto best = best_lap_of("7", two_laps(RampCorner{}, 1.0), AnalysisConfig{});
  REQUIRE(best.has_value());
  REQUIRE(best->lap.lap_number == 1);
  REQUIRE(best->lap.is_best_lap);
  REQUIRE(best->corners.size() == 1);
  REQUIRE(best->corners[0].distance_apex_m == Approx(180.0));

  auto short_lap = ramp_corner_lap();
  short_lap.resize(30);
  REQUIRE_FALSE(best_lap_of("7", short_lap, AnalysisConfig{}).has_value());
  REQUIRE_FALSE(best_lap_of("7", {}, AnalysisConfig{}).has_value());
}

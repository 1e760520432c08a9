#include <cstdio>
#include <string>
#include <utility>

#include <apex/json.hpp>
#include <apex/session.hpp>
#include <apex/synth.hpp>
#include <apex/track_config.hpp>
#include <apex/viewer/app.hpp>

using namespace apex;

// usage: apex_viewer [telemetry.json DRIVER_A DRIVER_B]
// Without arguments a synthetic two-driver session is shown.
int main(int argc, char** argv) {
  RaceKey key{.track = "demo", .race = 1};
  std::string id_a = "7", id_b = "13";
  std::optional<InMemoryTelemetrySource> source;

  if (argc == 4) {
    source = load_telemetry_json(argv[1], &key);
    if (!source) {
      std::fprintf(stderr, "apex_viewer: cannot read telemetry document '%s'\n", argv[1]);
      return 1;
    }
    id_a = argv[2];
    id_b = argv[3];
  } else if (argc == 1) {
    const TrackPath path = make_track_preset(TrackPreset::ChicaneHairpin);
    SynthParams params;
    DriverStyle a;
    a.speed_scale = 0.95;
    DriverStyle b;
    b.brake_decel_scale = 1.15;
    source.emplace();
    source->add(key, id_a, synthesize_session(path, params, a, 2));
    source->add(key, id_b, synthesize_session(path, params, b, 2));
  } else {
    std::fprintf(stderr, "usage: apex_viewer [telemetry.json DRIVER_A DRIVER_B]\n");
    return 2;
  }

  const AnalysisConfig cfg = analysis_config_for(track_config_catalog(), key.track);
  const auto samples_a = source->samples(key, id_a);
  const auto samples_b = source->samples(key, id_b);
  if (!samples_a || !samples_b) {
    std::fprintf(stderr, "apex_viewer: driver %s or %s not in session\n", id_a.c_str(), id_b.c_str());
    return 1;
  }

  auto lap_a = best_lap_of(id_a, *samples_a, cfg);
  auto lap_b = best_lap_of(id_b, *samples_b, cfg);
  if (!lap_a || !lap_b) {
    std::fprintf(stderr, "apex_viewer: no complete best lap for %s\n", !lap_a ? id_a.c_str() : id_b.c_str());
    return 1;
  }

  ViewerData data;
  data.title = key.track + " race " + std::to_string(key.race);
  data.driver_a_id = id_a;
  data.driver_b_id = id_b;
  data.comparison = compare_drivers(id_a, lap_a->corners, id_b, lap_b->corners, cfg.comparison);
  data.lap_a = std::move(*lap_a);
  data.lap_b = std::move(*lap_b);

  ViewerApp app(std::move(data));
  return app.run();
}

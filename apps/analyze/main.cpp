#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

#include <apex/json.hpp>
#include <apex/session.hpp>
#include <apex/synth.hpp>
#include <apex/track_config.hpp>

using namespace apex;

namespace {

struct Options {
  std::string telemetry_path;
  std::string track_key;
  std::string config_path;
  std::string compare_a;
  std::string compare_b;
  bool demo = false;
  bool emit_demo = false;
  bool all_laps = false;
  std::size_t threads = 0; // 0 = hardware concurrency
};

void usage() {
  std::fprintf(stderr,
    "usage: apex_analyze <telemetry.json> [--track KEY] [--config tracks.csv]\n"
    "                    [--all-laps] [--threads N] [--compare A B]\n"
    "       apex_analyze --demo [--all-laps] [--compare A B]\n"
    "       apex_analyze --emit-demo   (prints the demo telemetry document)\n");
}

bool parse_args(int argc, char** argv, Options& o) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto next = [&](std::string& dst) {
      if (i + 1 >= argc) return false;
      dst = argv[++i];
      return true;
    };
    if (arg == "--demo") o.demo = true;
    else if (arg == "--emit-demo") o.emit_demo = true;
    else if (arg == "--all-laps") o.all_laps = true;
    else if (arg == "--track") { if (!next(o.track_key)) return false; }
    else if (arg == "--config") { if (!next(o.config_path)) return false; }
    else if (arg == "--compare") {
      if (!next(o.compare_a) || !next(o.compare_b)) return false;
    }
    else if (arg == "--threads") {
      std::string n;
      if (!next(n)) return false;
      o.threads = static_cast<std::size_t>(std::strtoul(n.c_str(), nullptr, 10));
    }
    else if (!arg.empty() && arg[0] == '-') return false;
    else if (o.telemetry_path.empty()) o.telemetry_path = arg;
    else return false;
  }
  return o.demo || o.emit_demo || !o.telemetry_path.empty();
}

// Two drivers, three laps each, around the stadium preset.
InMemoryTelemetrySource demo_source(const RaceKey& key) {
  const TrackPath path = make_track_preset(TrackPreset::Stadium);
  SynthParams params;
  params.start_offset_m = kPI * 50.0; // lap starts at the top straight

  DriverStyle steady;
  steady.speed_scale = 0.95;
  DriverStyle late_braker;
  late_braker.speed_scale = 1.0;
  late_braker.brake_decel_scale = 1.15;

  InMemoryTelemetrySource src;
  src.add(key, "7", synthesize_session(path, params, steady, 3));
  src.add(key, "13", synthesize_session(path, params, late_braker, 3));
  return src;
}

} // namespace

int main(int argc, char** argv) {
  Options opt;
  if (!parse_args(argc, argv, opt)) {
    usage();
    return 2;
  }

  RaceKey key{.track = "demo", .race = 1};
  std::optional<InMemoryTelemetrySource> source;
  if (opt.demo || opt.emit_demo) {
    source = demo_source(key);
    if (opt.emit_demo) {
      std::printf("%s\n", telemetry_document(key, *source).dump(2).c_str());
      return 0;
    }
  } else {
    source = load_telemetry_json(opt.telemetry_path, &key);
    if (!source) {
      std::fprintf(stderr, "apex_analyze: cannot read telemetry document '%s'\n",
                   opt.telemetry_path.c_str());
      return 1;
    }
  }

  std::vector<TrackConfig> catalog = track_config_catalog();
  if (!opt.config_path.empty()) {
    auto loaded = load_track_config_csv(opt.config_path);
    if (!loaded) {
      std::fprintf(stderr, "apex_analyze: cannot open track config '%s'\n", opt.config_path.c_str());
      return 1;
    }
    catalog = std::move(*loaded);
  }
  // --track picks thresholds only; samples stay under the document's key
  const ResolvedThresholds thresholds = resolve_thresholds(catalog, key.track, opt.track_key);
  if (!thresholds.known) {
    std::fprintf(stderr, "apex_analyze: no thresholds for track '%s', using defaults\n",
                 thresholds.key.c_str());
  }
  const AnalysisConfig& cfg = thresholds.analysis;

  std::size_t threads = opt.threads;
  if (threads == 0) threads = std::max(1u, std::thread::hardware_concurrency());
  const AnalysisMode mode = opt.all_laps ? AnalysisMode::AllLaps : AnalysisMode::BestLapOnly;
  const RaceAnalysis race = analyze_race(*source, key, cfg, mode, threads);

  for (std::size_t i = 0; i < race.failed_drivers.size(); ++i) {
    const std::string& why = race.failure_messages[i];
    std::fprintf(stderr, "apex_analyze: driver %s has no usable telemetry%s%s\n",
                 race.failed_drivers[i].c_str(), why.empty() ? "" : ": ", why.c_str());
  }
  for (const auto& d : race.drivers) {
    if (d.skipped_samples > 0) {
      std::fprintf(stderr, "apex_analyze: driver %s: skipped %zu malformed samples\n",
                   d.driver_id.c_str(), d.skipped_samples);
    }
    for (const auto& l : d.laps) {
      if (l.status != LapStatus::Ok) {
        std::fprintf(stderr, "apex_analyze: driver %s lap %d: %s (%zu samples)\n",
                     d.driver_id.c_str(), l.lap_number, lap_status_name(l.status), l.sample_count);
      }
    }
  }

  Json out;
  out["analysis"] = race;

  std::string a = opt.compare_a, b = opt.compare_b;
  if (a.empty() && opt.demo) { a = "7"; b = "13"; }
  if (!a.empty()) {
    const DriverAnalysis* da = find_driver(race, a);
    const DriverAnalysis* db = find_driver(race, b);
    if (!da || !db) {
      std::fprintf(stderr, "apex_analyze: cannot compare %s and %s: driver not analyzed\n",
                   a.c_str(), b.c_str());
      return 1;
    }
    auto cmp = compare_best_laps(*da, *db, cfg.comparison);
    if (!cmp) {
      std::fprintf(stderr, "apex_analyze: cannot compare %s and %s: no complete best lap\n",
                   a.c_str(), b.c_str());
      return 1;
    }
    if (cmp->unmatched_a > 0 || cmp->unmatched_b > 0) {
      std::fprintf(stderr, "apex_analyze: corner counts differ (%zu vs %zu unmatched), comparing %zu corners\n",
                   cmp->unmatched_a, cmp->unmatched_b, cmp->corners.size());
    }
    out["comparison"] = *cmp;
  }

  std::printf("%s\n", out.dump(2).c_str());
  return 0;
}

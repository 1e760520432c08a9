#include <apex/session.hpp>
#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>

namespace apex {

void InMemoryTelemetrySource::add(const RaceKey& key, const std::string& driver_id,
                                  std::vector<Sample> samples) {
  auto& dst = data_[key][driver_id];
  dst.insert(dst.end(), samples.begin(), samples.end());
}

std::vector<std::string> InMemoryTelemetrySource::drivers(const RaceKey& key) const {
  std::vector<std::string> out;
  auto it = data_.find(key);
  if (it == data_.end()) return out;
  out.reserve(it->second.size());
  for (const auto& kv : it->second) out.push_back(kv.first);
  return out;
}

std::optional<std::vector<Sample>> InMemoryTelemetrySource::samples(const RaceKey& key,
                                                                    const std::string& driver_id) const {
  auto it = data_.find(key);
  if (it == data_.end()) return std::nullopt;
  auto jt = it->second.find(driver_id);
  if (jt == it->second.end()) return std::nullopt;
  return jt->second;
}

const char* lap_status_name(LapStatus s) {
  switch (s) {
    case LapStatus::Ok:            return "ok";
    case LapStatus::EmptyInput:    return "empty_input";
    case LapStatus::TooFewSamples: return "too_few_samples";
    default: return "unknown";
  }
}

const LapAnalysis* DriverAnalysis::best() const {
  for (const auto& l : laps) if (l.is_best_lap && l.status == LapStatus::Ok) return &l;
  return nullptr;
}

LapAnalysis analyze_lap(const Lap& lap, const AnalysisConfig& cfg) {
  LapAnalysis out;
  out.lap_number = lap.lap_number;
  out.lap_time_s = lap.lap_time_s;
  out.is_best_lap = lap.is_best_lap;
  out.sample_count = lap.samples.size();

  if (lap.samples.empty()) {
    out.status = LapStatus::EmptyInput;
    return out;
  }
  if (lap.samples.size() < cfg.min_lap_samples) {
    out.status = LapStatus::TooFewSamples;
    return out;
  }

  const auto zones = detect_corners(lap.samples, cfg.detection);
  out.corners = extract_all_metrics(lap, zones, cfg.extraction);
  return out;
}

std::optional<DriverAnalysis> analyze_driver(const std::string& driver_id,
                                             const std::vector<Sample>& samples,
                                             const AnalysisConfig& cfg,
                                             AnalysisMode mode) {
  auto seg = segment_laps(driver_id, samples, cfg.min_lap_samples);
  if (!seg) return std::nullopt;

  DriverAnalysis out;
  out.driver_id = driver_id;
  out.skipped_samples = seg->skipped_samples;
  out.lap_count = seg->laps.size();
  if (const Lap* best = seg->best_lap()) {
    out.best_lap_number = best->lap_number;
    out.best_lap_time_s = best->lap_time_s;
  }

  for (const auto& lap : seg->laps) {
    if (mode == AnalysisMode::BestLapOnly && !lap.is_best_lap) continue;
    out.laps.push_back(analyze_lap(lap, cfg));
  }
  return out;
}

RaceAnalysis analyze_race(const TelemetrySource& source,
                          const RaceKey& key,
                          const AnalysisConfig& cfg,
                          AnalysisMode mode,
                          std::size_t threads) {
  RaceAnalysis race;
  race.key = key;
  const auto ids = source.drivers(key);
  if (ids.empty()) return race;

  // One slot per driver; workers never touch the same slot.
  std::vector<std::optional<DriverAnalysis>> slots(ids.size());
  std::vector<std::string> errors(ids.size());
  std::atomic<std::size_t> next{0};
  auto worker = [&]() {
    for (;;) {
      const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
      if (i >= ids.size()) return;
      try {
        if (auto samples = source.samples(key, ids[i]); samples.has_value()) {
          slots[i] = analyze_driver(ids[i], *samples, cfg, mode);
        }
      } catch (const std::exception& e) {
        // Must not escape the thread; the driver is reported as failed
        slots[i].reset();
        errors[i] = e.what();
      }
    }
  };

  const std::size_t n_threads = std::clamp<std::size_t>(threads, 1, ids.size());
  if (n_threads == 1) {
    worker();
  } else {
    std::vector<std::thread> pool;
    pool.reserve(n_threads);
    for (std::size_t t = 0; t < n_threads; ++t) pool.emplace_back(worker);
    for (auto& th : pool) if (th.joinable()) th.join();
  }

  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (slots[i]) race.drivers.push_back(std::move(*slots[i]));
    else {
      race.failed_drivers.push_back(ids[i]);
      race.failure_messages.push_back(std::move(errors[i]));
    }
  }
  return race;
}

std::optional<BestLap> best_lap_of(const std::string& driver_id,
                                   const std::vector<Sample>& samples,
                                   const AnalysisConfig& cfg) {
  auto seg = segment_laps(driver_id, samples, cfg.min_lap_samples);
  if (!seg) return std::nullopt;
  const Lap* best = seg->best_lap();
  if (!best || best->samples.size() < cfg.min_lap_samples) return std::nullopt;

  BestLap out;
  out.lap = *best;
  out.corners = extract_all_metrics(out.lap, detect_corners(out.lap, cfg.detection), cfg.extraction);
  return out;
}

const DriverAnalysis* find_driver(const RaceAnalysis& race, const std::string& driver_id) {
  auto it = std::find_if(race.drivers.begin(), race.drivers.end(),
                         [&](const DriverAnalysis& d){ return d.driver_id == driver_id; });
  return it == race.drivers.end() ? nullptr : &*it;
}

std::optional<DriverComparison> compare_best_laps(const DriverAnalysis& a,
                                                  const DriverAnalysis& b,
                                                  const ComparisonConfig& cfg) {
  const LapAnalysis* la = a.best();
  const LapAnalysis* lb = b.best();
  if (!la || !lb) return std::nullopt;
  return compare_drivers(a.driver_id, la->corners, b.driver_id, lb->corners, cfg);
}

} // namespace apex

#include <apex/lap.hpp>
#include <algorithm>
#include <map>

namespace apex {

const Lap* LapSegmentation::best_lap() const {
  for (const auto& l : laps) if (l.is_best_lap) return &l;
  return nullptr;
}

const Lap* LapSegmentation::lap_by_number(int lap_number) const {
  auto it = std::find_if(laps.begin(), laps.end(),
                         [&](const Lap& l){ return l.lap_number == lap_number; });
  return it == laps.end() ? nullptr : &*it;
}

static void flag_best_lap(std::vector<Lap>& laps, std::size_t min_lap_samples) {
  Lap* best = nullptr;
  auto pick = [&](bool require_complete) {
    for (auto& l : laps) {
      if (require_complete && l.samples.size() < min_lap_samples) continue;
      if (!best || l.lap_time_s < best->lap_time_s) best = &l;
    }
  };
  pick(true);
  if (!best) pick(false);
  if (best) best->is_best_lap = true;
}

std::optional<LapSegmentation> segment_laps(const std::string& driver_id,
                                            const std::vector<Sample>& samples,
                                            std::size_t min_lap_samples) {
  if (samples.empty()) return std::nullopt;

  LapSegmentation out;
  std::map<int, std::vector<Sample>> by_lap;
  for (const auto& s : samples) {
    if (is_malformed(s)) { ++out.skipped_samples; continue; }
    by_lap[s.lap_number].push_back(s);
  }
  if (by_lap.empty()) return std::nullopt;

  out.laps.reserve(by_lap.size());
  for (auto& [number, lap_samples] : by_lap) {
    std::stable_sort(lap_samples.begin(), lap_samples.end(),
                     [](const Sample& a, const Sample& b){ return a.timestamp < b.timestamp; });
    Lap lap;
    lap.driver_id = driver_id;
    lap.lap_number = number;
    lap.lap_time_s = lap_samples.back().timestamp - lap_samples.front().timestamp;
    lap.samples = std::move(lap_samples);
    out.laps.push_back(std::move(lap));
  }

  flag_best_lap(out.laps, min_lap_samples);
  return out;
}

} // namespace apex

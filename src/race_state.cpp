#include <f1uc/race_state.hpp>
#include <f1uc/compound.hpp>
#include <algorithm>
#include <stdexcept>

namespace f1uc {

RaceState project_race_state(const RaceState& ref, int reference_lap, int lap) {
  const int dl = lap - reference_lap;
  RaceState s = ref;
  s.tire_age_b = std::max(0, ref.tire_age_b + dl);
  s.gap_s = ref.gap_s + static_cast<double>(dl) * ref.gap_trend_s_per_lap;
  return s;
}

RaceState ProjectedRaceState::state_at(const std::string&, int, const std::string&,
                                       const std::string&, int lap) const {
  return project_race_state(ref_, reference_lap_, lap);
}

void RaceStateTable::set(const std::string& gp, int year, const std::string& driver_a,
                         const std::string& driver_b, int reference_lap, RaceState state) {
  std::lock_guard<std::mutex> lock(mu_);
  entries_[Key{circuit_key(gp), year, to_upper(driver_a), to_upper(driver_b)}] =
      Entry{reference_lap, state};
}

RaceState RaceStateTable::state_at(const std::string& gp, int year,
                                   const std::string& driver_a, const std::string& driver_b,
                                   int lap) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(Key{circuit_key(gp), year, to_upper(driver_a), to_upper(driver_b)});
  if (it == entries_.end()) {
    throw std::out_of_range("no race state for " + gp + " " + std::to_string(year) + " " +
                            driver_a + "/" + driver_b);
  }
  return project_race_state(it->second.state, it->second.reference_lap, lap);
}

} // namespace f1uc

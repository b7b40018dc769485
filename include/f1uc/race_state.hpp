#pragma once
#include <map>
#include <mutex>
#include <string>
#include <tuple>

namespace f1uc {

struct RaceState {
  double gap_s = 0.0;               // A behind B
  int tire_age_b = 1;               // laps on B's set
  double gap_trend_s_per_lap = 0.0; // recent gap change per lap
};

// Live race state supplied by the caller's telemetry layer.
class RaceStateProvider {
public:
  virtual ~RaceStateProvider() = default;

  // May throw; the orchestrator surfaces any failure as UpstreamDataError.
  virtual RaceState state_at(const std::string& gp, int year,
                             const std::string& driver_a, const std::string& driver_b,
                             int lap) const = 0;
};

// A snapshot taken on `reference_lap`, projected linearly to other laps:
// B's set ages one lap per lap and the gap moves by the trend.
class ProjectedRaceState : public RaceStateProvider {
public:
  ProjectedRaceState(int reference_lap, RaceState at_reference)
    : reference_lap_(reference_lap), ref_(at_reference) {}

  RaceState state_at(const std::string& gp, int year,
                     const std::string& driver_a, const std::string& driver_b,
                     int lap) const override;

private:
  int reference_lap_;
  RaceState ref_;
};

// Snapshots per (gp, year, driver_a, driver_b), each projected from its own
// reference lap. Unknown pairings throw std::out_of_range.
class RaceStateTable : public RaceStateProvider {
public:
  void set(const std::string& gp, int year, const std::string& driver_a,
           const std::string& driver_b, int reference_lap, RaceState state);

  RaceState state_at(const std::string& gp, int year,
                     const std::string& driver_a, const std::string& driver_b,
                     int lap) const override;

private:
  using Key = std::tuple<std::string, int, std::string, std::string>;
  struct Entry {
    int reference_lap;
    RaceState state;
  };

  mutable std::mutex mu_;
  std::map<Key, Entry> entries_;
};

RaceState project_race_state(const RaceState& ref, int reference_lap, int lap);

} // namespace f1uc

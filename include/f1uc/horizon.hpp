#pragma once
#include <optional>
#include <utility>
#include <vector>
#include <f1uc/monte_carlo.hpp>

namespace f1uc {

// The scenario k laps ahead: A pits on lap + k, B's set is k laps older and
// the gap has moved by k * gap_trend. Same seed.
Scenario scenario_at_horizon(const Scenario& s, int k);

// [1, 2, ..., H]; empty for H < 1.
std::vector<int> horizon_range(int H);

// One self-contained run per horizon, in increasing horizon order. Entry i is
// identical to simulate(models, scenario_at_horizon(scenario, sorted[i])).
// Duplicates are evaluated once. Throws ValidationError on a negative horizon.
std::vector<SimulationResult> simulate_multihorizon(const ModelSet& models,
                                                    const Scenario& scenario,
                                                    std::vector<int> horizons,
                                                    const SamplerOptions& opts = {});

inline std::vector<SimulationResult> simulate_multihorizon(const FittedModel& deg,
                                                           const FittedModel& pit,
                                                           const FittedModel& outlap,
                                                           const Scenario& scenario,
                                                           std::vector<int> horizons,
                                                           const SamplerOptions& opts = {}) {
  return simulate_multihorizon(ModelSet{deg, pit, outlap}, scenario, std::move(horizons), opts);
}

// Lap with the highest p_undercut; the earliest wins ties. nullopt if empty.
std::optional<int> best_horizon(const std::vector<SimulationResult>& curve);

} // namespace f1uc

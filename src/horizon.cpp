#include <f1uc/horizon.hpp>
#include <f1uc/errors.hpp>
#include <algorithm>

namespace f1uc {

Scenario scenario_at_horizon(const Scenario& s, int k) {
  Scenario out = s;
  out.lap = s.lap + k;
  out.tire_age_b = s.tire_age_b + k;
  out.gap_s = s.gap_s + static_cast<double>(k) * s.gap_trend_s_per_lap;
  return out;
}

std::vector<int> horizon_range(int H) {
  std::vector<int> out;
  for (int k = 1; k <= H; ++k) out.push_back(k);
  return out;
}

std::vector<SimulationResult> simulate_multihorizon(const ModelSet& models,
                                                    const Scenario& scenario,
                                                    std::vector<int> horizons,
                                                    const SamplerOptions& opts) {
  std::sort(horizons.begin(), horizons.end());
  horizons.erase(std::unique(horizons.begin(), horizons.end()), horizons.end());
  if (!horizons.empty() && horizons.front() < 0) {
    throw ValidationError("horizons", "must be >= 0");
  }

  std::vector<SimulationResult> out;
  out.reserve(horizons.size());
  for (int k : horizons) {
    out.push_back(simulate(models, scenario_at_horizon(scenario, k), opts));
  }
  return out;
}

std::optional<int> best_horizon(const std::vector<SimulationResult>& curve) {
  if (curve.empty()) return std::nullopt;
  const SimulationResult* best = &curve.front();
  for (const auto& r : curve) {
    if (r.p_undercut > best->p_undercut ||
        (r.p_undercut == best->p_undercut && r.lap < best->lap)) {
      best = &r;
    }
  }
  return best->lap;
}

} // namespace f1uc

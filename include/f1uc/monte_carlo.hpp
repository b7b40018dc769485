#pragma once
#include <cstdint>
#include <f1uc/model_fitter.hpp>

namespace f1uc {

// Live race state at the evaluated lap, plus the run parameters.
struct Scenario {
  int lap = 1;                       // lap on which A pits
  double gap_s = 0.0;                // cushion A can spend on its stop (seconds)
  int tire_age_b = 1;                // laps on B's current set at `lap`
  double gap_trend_s_per_lap = 0.0;  // projected gap change per lap (horizons)
  double p_pit_next = 1.0;           // weight of the strict case: B stays out;
                                     // otherwise B answers on the next lap
  int samples = 1000;
  std::uint64_t seed = 42;
};

struct ModelSet {
  FittedModel deg;
  FittedModel pit;
  FittedModel outlap;
};

struct SimulationResult {
  int lap = 0;
  double p_undercut = 0.0;
  double pit_loss_s = 0.0;                // sample mean of A's stop loss
  double out_lap_delta_s = 0.0;           // sample mean of A's out-lap delta
  double avg_degradation_penalty_s = 0.0; // sample mean of B's old-tire penalty
  double success_margin_s = 0.0;          // sample mean of (gap + B's loss - A's loss)
  double ci_low_s = 0.0;                  // 5th percentile of the margin
  double ci_high_s = 0.0;                 // 95th percentile of the margin
  double current_gap_s = 0.0;
  int tire_age_driver_b = 0;
  int samples = 0;
  int successes = 0;
  int b_stays_out = 0;                    // trials in the strict case
  int b_pits_lap1 = 0;                    // trials where B answered the stop

  bool operator==(const SimulationResult&) const = default;
};

struct SamplerOptions {
  unsigned threads = 1; // 0 is treated as 1
};

// Trials are reduced in fixed blocks of this size, in block order.
inline constexpr int kTrialBlock = 256;

// Upper bound on trials per run; every margin is kept for the interval.
inline constexpr int kMaxTrials = 10000000;

// Seed of trial `index` in a run; independent of thread count and order.
std::uint64_t trial_seed(std::uint64_t run_seed, std::uint64_t index);

// Pure function of (models, scenario, seed). A trial succeeds when A's stop
// (pit loss + out-lap) costs less than the gap plus what B loses meanwhile: the
// old-tire penalty, and B's own pit loss when B answers.
// Throws ValidationError on samples outside [1, kMaxTrials], p_pit_next outside
// [0,1], a negative tire age or a non-finite gap.
SimulationResult simulate(const ModelSet& models, const Scenario& scenario,
                          const SamplerOptions& opts = {});

inline SimulationResult simulate(const FittedModel& deg, const FittedModel& pit,
                                 const FittedModel& outlap, const Scenario& scenario,
                                 const SamplerOptions& opts = {}) {
  return simulate(ModelSet{deg, pit, outlap}, scenario, opts);
}

} // namespace f1uc

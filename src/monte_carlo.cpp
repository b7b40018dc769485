#include <f1uc/monte_carlo.hpp>
#include <f1uc/errors.hpp>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace f1uc {

static inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9E3779B97F4A7C15ull;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
  return x ^ (x >> 31);
}

std::uint64_t trial_seed(std::uint64_t run_seed, std::uint64_t index) {
  return splitmix64(splitmix64(run_seed) ^ index);
}

namespace {

struct Tally {
  int successes = 0;
  int b_stays_out = 0;
  double pit_sum = 0.0;
  double outlap_sum = 0.0;
  double deg_sum = 0.0;
  double margin_sum = 0.0;
};

// One undercut attempt: A pits on `lap`; B either stays out on old tires or
// answers on the next lap and pays its own stop.
double run_trial(const ModelSet& m, const Scenario& s, double fresh_baseline,
                 std::uint64_t index, Tally& t) {
  Rng rng(trial_seed(s.seed, index));

  const double deg = m.deg.sample_at(static_cast<double>(s.tire_age_b), rng) - fresh_baseline;
  const double pit_a = m.pit.sample_at(0.0, rng);
  const double outlap = m.outlap.sample_at(0.0, rng);

  std::bernoulli_distribution stays_out(s.p_pit_next);
  const bool strict = stays_out(rng);
  const double pit_b = strict ? 0.0 : m.pit.sample_at(0.0, rng);

  const double a_loss = pit_a + outlap;
  const double b_loss = deg + pit_b;
  const double margin = s.gap_s + b_loss - a_loss;

  if (margin > 0.0) ++t.successes;
  if (strict) ++t.b_stays_out;
  t.pit_sum += pit_a;
  t.outlap_sum += outlap;
  t.deg_sum += deg;
  t.margin_sum += margin;
  return margin;
}

void run_block(const ModelSet& m, const Scenario& s, double fresh_baseline,
               std::int64_t block, Tally& t, std::vector<double>& margins) {
  const std::int64_t begin = block * kTrialBlock;
  const std::int64_t end = std::min<std::int64_t>(s.samples, begin + kTrialBlock);
  for (std::int64_t i = begin; i < end; ++i) {
    margins[static_cast<std::size_t>(i)] =
        run_trial(m, s, fresh_baseline, static_cast<std::uint64_t>(i), t);
  }
}

// Linear interpolation between order statistics; `sorted` is non-empty.
double percentile(const std::vector<double>& sorted, double q) {
  const double pos = q * static_cast<double>(sorted.size() - 1);
  const auto lo = static_cast<std::size_t>(std::floor(pos));
  const auto hi = std::min(lo + 1, sorted.size() - 1);
  const double w = pos - static_cast<double>(lo);
  return sorted[lo] + w * (sorted[hi] - sorted[lo]);
}

void validate_scenario(const Scenario& s) {
  if (s.samples < 1) throw ValidationError("samples", "must be >= 1");
  if (s.samples > kMaxTrials) {
    throw ValidationError("samples", "must be <= " + std::to_string(kMaxTrials));
  }
  if (!std::isfinite(s.p_pit_next) || s.p_pit_next < 0.0 || s.p_pit_next > 1.0) {
    throw ValidationError("p_pit_next", "must be within [0, 1]");
  }
  if (!std::isfinite(s.gap_s)) throw ValidationError("current_gap_s", "must be finite");
  if (!std::isfinite(s.gap_trend_s_per_lap)) {
    throw ValidationError("gap_trend_s_per_lap", "must be finite");
  }
  if (s.tire_age_b < 0) throw ValidationError("tire_age_driver_b", "must be >= 0");
}

} // namespace

SimulationResult simulate(const ModelSet& models, const Scenario& scenario,
                          const SamplerOptions& opts) {
  validate_scenario(scenario);

  // B's penalty is measured against a set on its first lap.
  const double fresh_baseline = models.deg.mean_at(1.0);

  const std::int64_t samples = scenario.samples;
  const std::int64_t blocks = (samples + kTrialBlock - 1) / kTrialBlock;
  std::vector<Tally> tallies(static_cast<std::size_t>(blocks));
  std::vector<double> margins(static_cast<std::size_t>(samples));

  const unsigned want = std::max(1u, opts.threads);
  const unsigned workers = static_cast<unsigned>(std::min<std::int64_t>(want, blocks));

  if (workers <= 1) {
    for (std::int64_t b = 0; b < blocks; ++b) {
      run_block(models, scenario, fresh_baseline, b, tallies[static_cast<std::size_t>(b)], margins);
    }
  } else {
    std::atomic<std::int64_t> next{0};
    auto worker = [&]() {
      for (std::int64_t b = next.fetch_add(1); b < blocks; b = next.fetch_add(1)) {
        run_block(models, scenario, fresh_baseline, b, tallies[static_cast<std::size_t>(b)], margins);
      }
    };
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (unsigned i = 0; i < workers; ++i) pool.emplace_back(worker);
    for (auto& th : pool) th.join();
  }

  // Reduce in block order so the sums do not depend on scheduling.
  Tally total;
  for (const auto& t : tallies) {
    total.successes += t.successes;
    total.b_stays_out += t.b_stays_out;
    total.pit_sum += t.pit_sum;
    total.outlap_sum += t.outlap_sum;
    total.deg_sum += t.deg_sum;
    total.margin_sum += t.margin_sum;
  }

  std::sort(margins.begin(), margins.end());

  const double n = static_cast<double>(scenario.samples);
  SimulationResult r;
  r.lap = scenario.lap;
  r.samples = scenario.samples;
  r.successes = total.successes;
  r.b_stays_out = total.b_stays_out;
  r.b_pits_lap1 = scenario.samples - total.b_stays_out;
  r.p_undercut = static_cast<double>(total.successes) / n;
  r.pit_loss_s = total.pit_sum / n;
  r.out_lap_delta_s = total.outlap_sum / n;
  r.avg_degradation_penalty_s = total.deg_sum / n;
  r.success_margin_s = total.margin_sum / n;
  r.ci_low_s = percentile(margins, 0.05);
  r.ci_high_s = percentile(margins, 0.95);
  r.current_gap_s = scenario.gap_s;
  r.tire_age_driver_b = scenario.tire_age_b;
  return r;
}

} // namespace f1uc

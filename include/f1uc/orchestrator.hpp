#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <f1uc/circuit.hpp>
#include <f1uc/config.hpp>
#include <f1uc/data_provider.hpp>
#include <f1uc/model_cache.hpp>
#include <f1uc/model_fitter.hpp>
#include <f1uc/monte_carlo.hpp>
#include <f1uc/race_state.hpp>

namespace f1uc {

struct ScenarioRequest {
  std::string gp;
  int year = 0;
  std::string driver_a;          // undercutting
  std::string driver_b;          // defending
  std::string compound_a;        // "SOFT" | "MEDIUM" | "HARD"
  int lap_now = 0;
  std::optional<int> samples;    // engine default when absent (1000)
  std::optional<int> H;          // horizon count; > 1 adds a per-horizon curve
  double p_pit_next = 1.0;
  std::optional<std::uint64_t> seed;
};

struct ModelAssumption {
  bool used_backoff = true;
  ContextLevel level = ContextLevel::Prior;
  std::size_t sample_count = 0;
  DistKind kind = DistKind::Normal;
};

// Realised split of the p_pit_next gate over the lap_now run.
struct ScenarioDistribution {
  int b_stays_out = 0;
  int b_pits_lap1 = 0;
};

struct Assumptions {
  double current_gap_s = 0.0;
  int tire_age_driver_b = 0;
  int h_laps_simulated = 1;     // lap_now plus any extra horizons
  std::string compound_a;       // canonical name, e.g. "MEDIUM"
  ScenarioDistribution scenario_distribution;
  ModelAssumption deg_model;
  ModelAssumption pit_model;
  ModelAssumption outlap_model;
  int monte_carlo_samples = 0;
  double p_pit_next = 1.0;
  std::uint64_t seed = 0;
  double success_margin_s = 0.0;
  double avg_degradation_penalty_s = 0.0;
};

struct SimulationResponse {
  SimulationResult result;                // evaluated on lap_now
  std::vector<SimulationResult> horizons; // lap_now+1 .. lap_now+H when H > 1
  std::optional<int> optimal_pit_lap;     // best lap over result + horizons
  Assumptions assumptions;
};

ModelAssumption describe(const FittedModel& m);

// Throws ValidationError naming the first offending field.
void validate_request(const ScenarioRequest& req, const EngineConfig& cfg);

class SimulationOrchestrator {
public:
  // data, race and catalog must outlive the orchestrator. catalog == nullptr
  // uses the built-in circuit catalog.
  SimulationOrchestrator(const HistoricalDataProvider& data,
                         const RaceStateProvider& race,
                         EngineConfig cfg = {},
                         const std::vector<Circuit>* catalog = nullptr);

  // Safe to call concurrently. Throws ValidationError or UpstreamDataError.
  SimulationResponse run(const ScenarioRequest& req) const;

  const EngineConfig& config() const { return cfg_; }
  ModelCache& cache() const { return cache_; }

private:
  RaceState fetch_race_state_(const ScenarioRequest& req) const;

  const HistoricalDataProvider& data_;
  const RaceStateProvider& race_;
  EngineConfig cfg_;
  const std::vector<Circuit>* catalog_ = nullptr;
  mutable ModelCache cache_;
};

} // namespace f1uc

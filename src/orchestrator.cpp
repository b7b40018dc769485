#include <f1uc/orchestrator.hpp>
#include <f1uc/compound.hpp>
#include <f1uc/errors.hpp>
#include <f1uc/horizon.hpp>
#include <f1uc/log.hpp>
#include <cmath>

namespace f1uc {

ModelAssumption describe(const FittedModel& m) {
  return ModelAssumption{m.used_backoff, m.level, m.sample_count, m.dist.kind};
}

static bool blank(const std::string& s) {
  return circuit_key(s).empty();
}

void validate_request(const ScenarioRequest& req, const EngineConfig& cfg) {
  if (blank(req.gp)) throw ValidationError("gp", "must not be empty");
  if (req.year < 1950) throw ValidationError("year", "must be >= 1950");
  if (blank(req.driver_a)) throw ValidationError("driver_a", "must not be empty");
  if (blank(req.driver_b)) throw ValidationError("driver_b", "must not be empty");
  if (to_upper(circuit_key(req.driver_a)) == to_upper(circuit_key(req.driver_b))) {
    throw ValidationError("driver_b", "must differ from driver_a");
  }
  if (!parse_compound(req.compound_a)) {
    throw ValidationError("compound_a", "must be one of SOFT, MEDIUM, HARD");
  }
  if (req.lap_now < 1) throw ValidationError("lap_now", "must be >= 1");
  if (req.samples) {
    if (*req.samples < 1) throw ValidationError("samples", "must be >= 1");
    if (*req.samples > cfg.max_samples) {
      throw ValidationError("samples", "must be <= " + std::to_string(cfg.max_samples));
    }
  }
  if (req.H && (*req.H < 1 || *req.H > cfg.max_horizon)) {
    throw ValidationError("H", "must be within [1, " + std::to_string(cfg.max_horizon) + "]");
  }
  if (!std::isfinite(req.p_pit_next) || req.p_pit_next < 0.0 || req.p_pit_next > 1.0) {
    throw ValidationError("p_pit_next", "must be within [0, 1]");
  }
}

SimulationOrchestrator::SimulationOrchestrator(const HistoricalDataProvider& data,
                                               const RaceStateProvider& race,
                                               EngineConfig cfg,
                                               const std::vector<Circuit>* catalog)
  : data_(data), race_(race), cfg_(cfg), catalog_(catalog) {}

RaceState SimulationOrchestrator::fetch_race_state_(const ScenarioRequest& req) const {
  RaceState st;
  try {
    st = race_.state_at(req.gp, req.year, req.driver_a, req.driver_b, req.lap_now);
  } catch (const UpstreamDataError&) {
    throw;
  } catch (const std::exception& e) {
    throw UpstreamDataError(std::string("race state query failed: ") + e.what());
  }
  if (!std::isfinite(st.gap_s) || !std::isfinite(st.gap_trend_s_per_lap) || st.tire_age_b < 0) {
    throw UpstreamDataError("race state for " + req.driver_a + "/" + req.driver_b +
                            " is not usable");
  }
  return st;
}

SimulationResponse SimulationOrchestrator::run(const ScenarioRequest& req) const {
  validate_request(req, cfg_);
  const Compound compound = *parse_compound(req.compound_a);

  log_info("simulate ", req.gp, " ", req.year, " ", req.driver_a, " vs ", req.driver_b,
           " ", compound_name(compound), " lap ", req.lap_now);

  const RaceState state = fetch_race_state_(req);

  const FitContext ctx{circuit_key(req.gp), req.year, compound};
  const ModelFitter fitter(data_, cfg_.fit, cfg_.cache_models ? &cache_ : nullptr, catalog_);
  const ModelSet models{
    fitter.fit(Family::Degradation, ctx),
    fitter.fit(Family::PitLoss, ctx),
    fitter.fit(Family::OutLap, ctx),
  };

  Scenario scenario;
  scenario.lap = req.lap_now;
  scenario.gap_s = state.gap_s;
  scenario.tire_age_b = state.tire_age_b;
  scenario.gap_trend_s_per_lap = state.gap_trend_s_per_lap;
  scenario.p_pit_next = req.p_pit_next;
  scenario.samples = req.samples.value_or(cfg_.default_samples);
  scenario.seed = req.seed.value_or(cfg_.default_seed);

  const SamplerOptions opts{cfg_.threads};

  SimulationResponse resp;
  resp.result = simulate(models, scenario, opts);
  if (req.H && *req.H > 1) {
    resp.horizons = simulate_multihorizon(models, scenario, horizon_range(*req.H), opts);
    std::vector<SimulationResult> all{resp.result};
    all.insert(all.end(), resp.horizons.begin(), resp.horizons.end());
    resp.optimal_pit_lap = best_horizon(all);
  }

  auto& a = resp.assumptions;
  a.current_gap_s = state.gap_s;
  a.tire_age_driver_b = state.tire_age_b;
  a.h_laps_simulated = 1 + static_cast<int>(resp.horizons.size());
  a.compound_a = compound_name(compound);
  a.scenario_distribution = ScenarioDistribution{resp.result.b_stays_out, resp.result.b_pits_lap1};
  a.deg_model = describe(models.deg);
  a.pit_model = describe(models.pit);
  a.outlap_model = describe(models.outlap);
  a.monte_carlo_samples = resp.result.samples;
  a.p_pit_next = scenario.p_pit_next;
  a.seed = scenario.seed;
  a.success_margin_s = resp.result.success_margin_s;
  a.avg_degradation_penalty_s = resp.result.avg_degradation_penalty_s;

  log_info("p_undercut=", resp.result.p_undercut, " pit=", resp.result.pit_loss_s,
           " outlap=", resp.result.out_lap_delta_s);
  return resp;
}

} // namespace f1uc

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <f1uc/circuit.hpp>
#include <f1uc/compound.hpp>
#include <f1uc/data_provider.hpp>
#include <f1uc/distribution.hpp>
#include <f1uc/observation.hpp>

namespace f1uc {

class ModelCache;

// Backoff rungs, most specific first. Prior is the terminal, data-free rung.
enum class ContextLevel : int {
  CircuitSeasonCompound = 0,
  CircuitCompound = 1,
  CompoundOnly = 2,
  Global = 3,
  Prior = 4
};

const char* context_level_name(ContextLevel l);

// The most specific context a request can offer.
struct FitContext {
  std::string circuit;
  int season = 0;
  Compound compound = Compound::Medium;
};

struct FittedModel {
  Family family = Family::Degradation;
  Distribution dist;            // degradation: intercept + noise; others: the value itself
  double slope_per_lap = 0.0;   // degradation only
  double curve_per_lap2 = 0.0;  // degradation only, coefficient of age^2
  ContextLevel level = ContextLevel::Prior;
  std::size_t sample_count = 0; // observations the fit actually used
  bool degenerate = false;      // zero variance or a single observation
  bool used_backoff = true;     // prior or degenerate; reported as !models_fitted

  double mean_at(double tire_age) const;
  double sample_at(double tire_age, Rng& rng) const;
};

// Minimum usable observations for a rung to be fitted.
struct FitPolicy {
  std::size_t min_degradation = 10;
  std::size_t min_pit_loss = 5;
  std::size_t min_out_lap = 5;

  std::size_t min_observations(Family f) const;
};

struct BackoffRung {
  ContextLevel level;
  DataQuery (*narrow)(Family family, const FitContext& ctx);
};

// Ordered data rungs; the prior follows the last one.
const std::vector<BackoffRung>& backoff_ladder();

// Fits one rung from already-filtered observations. nullopt below the policy threshold.
std::optional<FittedModel> fit_observations(Family family,
                                            const std::vector<Observation>& usable,
                                            ContextLevel level,
                                            const FitPolicy& policy);

// Hardcoded terminal model. The pit-loss prior is centred on the catalogued
// stop loss of the circuit when it is known.
FittedModel prior_model(Family family, const FitContext& ctx,
                        const std::vector<Circuit>& catalog);

class ModelFitter {
public:
  // data, catalog and cache must outlive the fitter. catalog == nullptr uses the built-in one.
  explicit ModelFitter(const HistoricalDataProvider& data,
                       FitPolicy policy = {},
                       ModelCache* cache = nullptr,
                       const std::vector<Circuit>* catalog = nullptr);

  // Total: always returns a model. Throws UpstreamDataError if the provider fails.
  FittedModel fit(Family family, const FitContext& ctx) const;

  const FitPolicy& policy() const { return policy_; }

private:
  FittedModel fit_ladder_(Family family, const FitContext& ctx) const;

  const HistoricalDataProvider& data_;
  FitPolicy policy_;
  ModelCache* cache_ = nullptr;
  const std::vector<Circuit>* catalog_ = nullptr;
};

} // namespace f1uc

#include <f1uc/model_fitter.hpp>
#include <f1uc/errors.hpp>
#include <f1uc/log.hpp>
#include <f1uc/model_cache.hpp>
#include <algorithm>
#include <cmath>

namespace f1uc {

const char* context_level_name(ContextLevel l) {
  switch (l) {
    case ContextLevel::CircuitSeasonCompound: return "circuit_season_compound";
    case ContextLevel::CircuitCompound:       return "circuit_compound";
    case ContextLevel::CompoundOnly:          return "compound";
    case ContextLevel::Global:                return "global";
    case ContextLevel::Prior:                 return "prior";
  }
  return "unknown";
}

static double age_trend(const FittedModel& m, double tire_age) {
  return m.slope_per_lap * tire_age + m.curve_per_lap2 * tire_age * tire_age;
}

double FittedModel::mean_at(double tire_age) const {
  return dist.mean() + age_trend(*this, tire_age);
}

double FittedModel::sample_at(double tire_age, Rng& rng) const {
  return dist.sample(rng) + age_trend(*this, tire_age);
}

std::size_t FitPolicy::min_observations(Family f) const {
  switch (f) {
    case Family::Degradation: return min_degradation;
    case Family::PitLoss:     return min_pit_loss;
    case Family::OutLap:      return min_out_lap;
  }
  return min_degradation;
}

// ---- Ladder rungs ---------------------------------------------------------

static DataQuery narrow_circuit_season_compound(Family f, const FitContext& c) {
  return DataQuery{f, c.circuit, c.season, c.compound};
}

static DataQuery narrow_circuit_compound(Family f, const FitContext& c) {
  return DataQuery{f, c.circuit, std::nullopt, c.compound};
}

static DataQuery narrow_compound(Family f, const FitContext& c) {
  return DataQuery{f, std::nullopt, std::nullopt, c.compound};
}

static DataQuery narrow_global(Family f, const FitContext&) {
  return DataQuery{f, std::nullopt, std::nullopt, std::nullopt};
}

const std::vector<BackoffRung>& backoff_ladder() {
  static const std::vector<BackoffRung> ladder{
    {ContextLevel::CircuitSeasonCompound, &narrow_circuit_season_compound},
    {ContextLevel::CircuitCompound,       &narrow_circuit_compound},
    {ContextLevel::CompoundOnly,          &narrow_compound},
    {ContextLevel::Global,                &narrow_global},
  };
  return ladder;
}

// ---- Estimators -----------------------------------------------------------

std::optional<FittedModel> fit_observations(Family family,
                                            const std::vector<Observation>& usable,
                                            ContextLevel level,
                                            const FitPolicy& policy) {
  const std::size_t need = std::max<std::size_t>(1, policy.min_observations(family));
  if (usable.size() < need) return std::nullopt;

  FittedModel m;
  m.family = family;
  m.level = level;
  m.sample_count = usable.size();

  std::vector<double> values;
  values.reserve(usable.size());
  for (const auto& o : usable) values.push_back(o.value_s);

  switch (family) {
    case Family::Degradation: {
      std::vector<double> ages;
      ages.reserve(usable.size());
      for (const auto& o : usable) ages.push_back(static_cast<double>(o.tire_age));
      const auto quad = fit_quadratic(ages, values);
      m.dist = Distribution{DistKind::Normal, quad.intercept, quad.residual_sd};
      m.slope_per_lap = quad.slope;
      m.curve_per_lap2 = quad.curvature;
      break;
    }
    case Family::PitLoss: {
      // Usable pit losses are strictly positive, so the log fit cannot fail here.
      const auto ln = fit_lognormal(values);
      if (!ln) return std::nullopt;
      m.dist = *ln;
      break;
    }
    case Family::OutLap:
      m.dist = fit_normal(values);
      break;
  }

  if (!std::isfinite(m.dist.mu) || !std::isfinite(m.slope_per_lap) ||
      !std::isfinite(m.curve_per_lap2)) {
    return std::nullopt;
  }

  m.degenerate = m.sample_count < 2 || m.dist.is_point();
  m.used_backoff = m.degenerate;
  return m;
}

FittedModel prior_model(Family family, const FitContext& ctx,
                        const std::vector<Circuit>& catalog) {
  FittedModel m;
  m.family = family;
  m.level = ContextLevel::Prior;
  m.sample_count = 0;
  m.used_backoff = true;

  switch (family) {
    case Family::Degradation:
      m.dist = Distribution{DistKind::Normal, 0.0, 0.3};
      m.slope_per_lap = 0.05;
      m.curve_per_lap2 = 0.002;
      break;
    case Family::PitLoss: {
      double mean = 25.0;
      if (auto c = circuit_by_key_in(catalog, ctx.circuit); c.has_value()) {
        const double nominal = circuit_pit_loss(*c);
        if (nominal > 0.0) mean = nominal;
      }
      m.dist = lognormal_from_moments(mean, 3.0);
      break;
    }
    case Family::OutLap:
      switch (ctx.compound) {
        case Compound::Soft:   m.dist = Distribution{DistKind::Normal, 0.5, 0.3}; break;
        case Compound::Medium: m.dist = Distribution{DistKind::Normal, 1.2, 0.4}; break;
        case Compound::Hard:   m.dist = Distribution{DistKind::Normal, 2.0, 0.5}; break;
      }
      break;
  }
  return m;
}

// ---- ModelFitter ----------------------------------------------------------

ModelFitter::ModelFitter(const HistoricalDataProvider& data,
                         FitPolicy policy,
                         ModelCache* cache,
                         const std::vector<Circuit>* catalog)
  : data_(data), policy_(policy), cache_(cache), catalog_(catalog) {}

static std::vector<Observation> query_upstream(const HistoricalDataProvider& data,
                                               const DataQuery& q) {
  try {
    return data.query(q);
  } catch (const UpstreamDataError&) {
    throw;
  } catch (const std::exception& e) {
    throw UpstreamDataError(std::string("historical data query failed: ") + e.what());
  }
}

static std::uint64_t revision_upstream(const HistoricalDataProvider& data) {
  try {
    return data.revision();
  } catch (const UpstreamDataError&) {
    throw;
  } catch (const std::exception& e) {
    throw UpstreamDataError(std::string("historical data revision failed: ") + e.what());
  }
}

FittedModel ModelFitter::fit(Family family, const FitContext& ctx) const {
  if (!cache_) return fit_ladder_(family, ctx);

  const ModelKey key{family, circuit_key(ctx.circuit), ctx.season, ctx.compound};
  const auto rev = revision_upstream(data_);
  if (auto hit = cache_->find(key, rev); hit.has_value()) {
    log_debug("cache hit: ", family_name(family), " ", key.circuit, "/", key.season,
              "/", compound_name(key.compound));
    return *hit;
  }
  auto model = fit_ladder_(family, ctx);
  cache_->store(key, rev, model);
  return model;
}

FittedModel ModelFitter::fit_ladder_(Family family, const FitContext& ctx) const {
  const std::size_t need = policy_.min_observations(family);

  for (const auto& rung : backoff_ladder()) {
    const auto raw = query_upstream(data_, rung.narrow(family, ctx));
    const auto usable = filter_usable(raw);
    if (usable.size() < raw.size()) {
      log_debug(family_name(family), " @ ", context_level_name(rung.level), ": discarded ",
                raw.size() - usable.size(), " malformed observation(s)");
    }
    if (auto m = fit_observations(family, usable, rung.level, policy_); m.has_value()) {
      log_info(family_name(family), " fitted at ", context_level_name(rung.level),
               " (n=", m->sample_count, m->degenerate ? ", degenerate" : "", ")");
      return *m;
    }
    log_debug(family_name(family), " @ ", context_level_name(rung.level), ": ",
              usable.size(), " < ", need, " observations, backing off");
  }

  log_warn(family_name(family), ": no rung had enough data for ", ctx.circuit, "/",
           ctx.season, "/", compound_name(ctx.compound), ", using prior");
  return prior_model(family, ctx, catalog_ ? *catalog_ : circuit_catalog());
}

} // namespace f1uc

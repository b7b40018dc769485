#pragma once
#include <optional>
#include <random>
#include <vector>

namespace f1uc {

using Rng = std::mt19937_64;

enum class DistKind : int {
  Normal = 0,
  LogNormal = 1
};

const char* dist_kind_name(DistKind k);

// Normal: mu/sigma of the value. LogNormal: mu/sigma of log(value).
struct Distribution {
  DistKind kind = DistKind::Normal;
  double mu = 0.0;
  double sigma = 0.0;

  double mean() const;
  double stddev() const;

  // Zero or non-finite sigma degrades to a point draw at mean().
  bool is_point() const;
  double sample(Rng& rng) const;
};

// Method of moments (sample sd, n-1). A single value gives sigma = 0.
// Requires a non-empty input.
Distribution fit_normal(const std::vector<double>& xs);

// Maximum likelihood on log values; nullopt if empty or any value <= 0.
std::optional<Distribution> fit_lognormal(const std::vector<double>& xs);

// LogNormal with the given arithmetic mean and standard deviation (mean > 0).
Distribution lognormal_from_moments(double mean, double sd);

// Ordinary least squares y = intercept + slope * x.
struct LinearFit {
  double intercept = 0.0;
  double slope = 0.0;
  double residual_sd = 0.0;
};

// Zero variance in x gives slope 0 and the mean of y. Requires xs.size() == ys.size() > 0.
LinearFit fit_linear(const std::vector<double>& xs, const std::vector<double>& ys);

// Least squares y = intercept + slope * x + curvature * x^2.
struct QuadraticFit {
  double intercept = 0.0;
  double slope = 0.0;
  double curvature = 0.0;
  double residual_sd = 0.0;
};

// Fewer than three distinct x values degrade to fit_linear (curvature 0).
// Requires xs.size() == ys.size() > 0.
QuadraticFit fit_quadratic(const std::vector<double>& xs, const std::vector<double>& ys);

} // namespace f1uc

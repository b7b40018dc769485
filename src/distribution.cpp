#include <f1uc/distribution.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace f1uc {

const char* dist_kind_name(DistKind k) {
  switch (k) {
    case DistKind::Normal:    return "normal";
    case DistKind::LogNormal: return "lognormal";
  }
  return "unknown";
}

double Distribution::mean() const {
  if (kind == DistKind::LogNormal) {
    const double s = std::isfinite(sigma) && sigma > 0.0 ? sigma : 0.0;
    return std::exp(mu + 0.5 * s * s);
  }
  return mu;
}

double Distribution::stddev() const {
  if (is_point()) return 0.0;
  if (kind == DistKind::LogNormal) {
    const double s2 = sigma * sigma;
    return std::sqrt((std::exp(s2) - 1.0) * std::exp(2.0 * mu + s2));
  }
  return sigma;
}

bool Distribution::is_point() const {
  return !std::isfinite(sigma) || sigma <= 0.0;
}

double Distribution::sample(Rng& rng) const {
  if (is_point()) return mean();
  if (kind == DistKind::LogNormal) {
    std::lognormal_distribution<double> d(mu, sigma);
    return d(rng);
  }
  std::normal_distribution<double> d(mu, sigma);
  return d(rng);
}

static double mean_of(const std::vector<double>& xs) {
  return std::accumulate(xs.begin(), xs.end(), 0.0) / static_cast<double>(xs.size());
}

static double sd_of(const std::vector<double>& xs, double m) {
  if (xs.size() < 2) return 0.0;
  double ss = 0.0;
  for (double x : xs) ss += (x - m) * (x - m);
  return std::sqrt(ss / static_cast<double>(xs.size() - 1));
}

Distribution fit_normal(const std::vector<double>& xs) {
  const double m = mean_of(xs);
  return Distribution{DistKind::Normal, m, sd_of(xs, m)};
}

std::optional<Distribution> fit_lognormal(const std::vector<double>& xs) {
  if (xs.empty()) return std::nullopt;
  std::vector<double> logs;
  logs.reserve(xs.size());
  for (double x : xs) {
    if (!(x > 0.0) || !std::isfinite(x)) return std::nullopt;
    logs.push_back(std::log(x));
  }
  const double m = mean_of(logs);
  return Distribution{DistKind::LogNormal, m, sd_of(logs, m)};
}

Distribution lognormal_from_moments(double mean, double sd) {
  const double s2 = std::log(1.0 + (sd * sd) / (mean * mean));
  return Distribution{DistKind::LogNormal, std::log(mean) - 0.5 * s2, std::sqrt(s2)};
}

LinearFit fit_linear(const std::vector<double>& xs, const std::vector<double>& ys) {
  const double n = static_cast<double>(xs.size());
  const double mx = mean_of(xs);
  const double my = mean_of(ys);

  double sxx = 0.0, sxy = 0.0;
  for (std::size_t i = 0; i < xs.size(); ++i) {
    sxx += (xs[i] - mx) * (xs[i] - mx);
    sxy += (xs[i] - mx) * (ys[i] - my);
  }

  LinearFit fit;
  const bool has_slope = sxx > 0.0;
  fit.slope = has_slope ? sxy / sxx : 0.0;
  fit.intercept = my - fit.slope * mx;

  double ss_res = 0.0;
  for (std::size_t i = 0; i < xs.size(); ++i) {
    const double r = ys[i] - (fit.intercept + fit.slope * xs[i]);
    ss_res += r * r;
  }
  // One dof per estimated coefficient.
  const double dof = n - (has_slope ? 2.0 : 1.0);
  fit.residual_sd = dof > 0.0 ? std::sqrt(ss_res / dof) : 0.0;
  return fit;
}

static double det3(const double m[3][3]) {
  return m[0][0] * (m[1][1] * m[2][2] - m[1][2] * m[2][1]) -
         m[0][1] * (m[1][0] * m[2][2] - m[1][2] * m[2][0]) +
         m[0][2] * (m[1][0] * m[2][1] - m[1][1] * m[2][0]);
}

static std::size_t distinct_count(std::vector<double> xs) {
  std::sort(xs.begin(), xs.end());
  return static_cast<std::size_t>(std::unique(xs.begin(), xs.end()) - xs.begin());
}

QuadraticFit fit_quadratic(const std::vector<double>& xs, const std::vector<double>& ys) {
  QuadraticFit fit;
  if (distinct_count(xs) < 3) {
    const auto lin = fit_linear(xs, ys);
    fit.intercept = lin.intercept;
    fit.slope = lin.slope;
    fit.residual_sd = lin.residual_sd;
    return fit;
  }

  // Centre x so the normal equations stay well conditioned for ages up to ~50.
  const double mx = mean_of(xs);
  double s1 = 0.0, s2 = 0.0, s3 = 0.0, s4 = 0.0;
  double t0 = 0.0, t1 = 0.0, t2 = 0.0;
  for (std::size_t i = 0; i < xs.size(); ++i) {
    const double u = xs[i] - mx;
    const double u2 = u * u;
    s1 += u; s2 += u2; s3 += u2 * u; s4 += u2 * u2;
    t0 += ys[i]; t1 += u * ys[i]; t2 += u2 * ys[i];
  }
  const double n = static_cast<double>(xs.size());
  const double a[3][3] = {{n, s1, s2}, {s1, s2, s3}, {s2, s3, s4}};
  const double d = det3(a);
  if (!(std::abs(d) > 0.0) || !std::isfinite(d)) {
    const auto lin = fit_linear(xs, ys);
    fit.intercept = lin.intercept;
    fit.slope = lin.slope;
    fit.residual_sd = lin.residual_sd;
    return fit;
  }

  // Cramer's rule on the centred system.
  const double rhs[3] = {t0, t1, t2};
  double c[3];
  for (int k = 0; k < 3; ++k) {
    double m[3][3];
    for (int r = 0; r < 3; ++r) {
      for (int col = 0; col < 3; ++col) m[r][col] = (col == k) ? rhs[r] : a[r][col];
    }
    c[k] = det3(m) / d;
  }

  // Back to powers of x: c0 + c1 (x - mx) + c2 (x - mx)^2.
  fit.curvature = c[2];
  fit.slope = c[1] - 2.0 * c[2] * mx;
  fit.intercept = c[0] - c[1] * mx + c[2] * mx * mx;

  double ss_res = 0.0;
  for (std::size_t i = 0; i < xs.size(); ++i) {
    const double r = ys[i] - (fit.intercept + fit.slope * xs[i] + fit.curvature * xs[i] * xs[i]);
    ss_res += r * r;
  }
  const double dof = n - 3.0;
  fit.residual_sd = dof > 0.0 ? std::sqrt(ss_res / dof) : 0.0;
  return fit;
}

} // namespace f1uc

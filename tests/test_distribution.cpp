#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <vector>

#include <f1uc/distribution.hpp>

using Catch::Approx;
using namespace f1uc;

TEST_CASE("fit_normal uses sample mean and sd") {
  auto d = fit_normal({1.0, 2.0, 3.0, 4.0});
  REQUIRE(d.kind == DistKind::Normal);
  REQUIRE(d.mu == Approx(2.5));
  REQUIRE(d.sigma == Approx(std::sqrt(5.0 / 3.0)));
  REQUIRE_FALSE(d.is_point());

  auto single = fit_normal({7.0});
  REQUIRE(single.sigma == 0.0);
  REQUIRE(single.is_point());
}

TEST_CASE("fit_lognormal is MLE on logs and rejects non-positive values") {
  auto d = fit_lognormal({std::exp(1.0), std::exp(3.0)});
  REQUIRE(d.has_value());
  REQUIRE(d->kind == DistKind::LogNormal);
  REQUIRE(d->mu == Approx(2.0));

  REQUIRE_FALSE(fit_lognormal({}).has_value());
  REQUIRE_FALSE(fit_lognormal({20.0, 0.0}).has_value());
  REQUIRE_FALSE(fit_lognormal({20.0, -3.0}).has_value());
}

TEST_CASE("lognormal_from_moments reproduces the requested moments") {
  auto d = lognormal_from_moments(23.0, 3.0);
  REQUIRE(d.kind == DistKind::LogNormal);
  REQUIRE(d.mean() == Approx(23.0));
  REQUIRE(d.stddev() == Approx(3.0));
}

TEST_CASE("point distributions draw their mean") {
  Rng rng(7);
  Distribution n{DistKind::Normal, 1.5, 0.0};
  Distribution ln{DistKind::LogNormal, std::log(20.0), 0.0};
  Distribution nan_sigma{DistKind::Normal, 0.8, std::nan("")};

  for (int i = 0; i < 10; ++i) {
    REQUIRE(n.sample(rng) == 1.5);
    REQUIRE(ln.sample(rng) == Approx(20.0));
    REQUIRE(nan_sigma.sample(rng) == 0.8);
  }
}

TEST_CASE("samples are finite and centred") {
  Rng rng(42);
  Distribution d{DistKind::Normal, 2.0, 0.5};
  double sum = 0.0;
  const int n = 20000;
  for (int i = 0; i < n; ++i) {
    const double x = d.sample(rng);
    REQUIRE(std::isfinite(x));
    sum += x;
  }
  REQUIRE(sum / n == Approx(2.0).margin(0.02));
}

TEST_CASE("fit_linear recovers an exact line") {
  std::vector<double> xs{1, 2, 3, 4, 5};
  std::vector<double> ys;
  for (double x : xs) ys.push_back(0.3 + 0.1 * x);

  auto f = fit_linear(xs, ys);
  REQUIRE(f.slope == Approx(0.1));
  REQUIRE(f.intercept == Approx(0.3));
  REQUIRE(f.residual_sd == Approx(0.0).margin(1e-12));
}

TEST_CASE("fit_linear with no variance in x falls back to the mean") {
  auto f = fit_linear({4, 4, 4}, {1.0, 2.0, 3.0});
  REQUIRE(f.slope == 0.0);
  REQUIRE(f.intercept == Approx(2.0));
  REQUIRE(f.residual_sd == Approx(1.0));
}

TEST_CASE("fit_quadratic recovers a known curve") {
  std::vector<double> xs, ys;
  for (int age = 1; age <= 30; ++age) {
    xs.push_back(age);
    ys.push_back(0.5 + 0.05 * age + 0.002 * age * age);
  }
  auto f = fit_quadratic(xs, ys);
  REQUIRE(f.intercept == Approx(0.5));
  REQUIRE(f.slope == Approx(0.05));
  REQUIRE(f.curvature == Approx(0.002));
  REQUIRE(f.residual_sd == Approx(0.0).margin(1e-9));
}

TEST_CASE("fit_quadratic on a straight line has no curvature") {
  auto f = fit_quadratic({1, 2, 3, 4}, {0.1, 0.2, 0.3, 0.4});
  REQUIRE(f.slope == Approx(0.1));
  REQUIRE(f.curvature == Approx(0.0).margin(1e-12));
}

TEST_CASE("fit_quadratic with two distinct x values is a line") {
  auto f = fit_quadratic({2, 2, 5, 5}, {1.0, 1.0, 4.0, 4.0});
  REQUIRE(f.curvature == 0.0);
  REQUIRE(f.slope == Approx(1.0));
  REQUIRE(f.intercept == Approx(-1.0));
}

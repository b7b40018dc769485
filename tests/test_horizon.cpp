#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <f1uc/errors.hpp>
#include <f1uc/horizon.hpp>

using Catch::Approx;
using namespace f1uc;

namespace {

ModelSet models() {
  FittedModel deg;
  deg.family = Family::Degradation;
  deg.dist = Distribution{DistKind::Normal, 0.0, 0.25};
  deg.slope_per_lap = 0.1;

  FittedModel pit;
  pit.family = Family::PitLoss;
  pit.dist = lognormal_from_moments(21.0, 1.0);

  FittedModel out;
  out.family = Family::OutLap;
  out.dist = Distribution{DistKind::Normal, 1.0, 0.3};
  return ModelSet{deg, pit, out};
}

Scenario scenario() {
  Scenario s;
  s.lap = 15;
  s.gap_s = 1.2;
  s.tire_age_b = 14;
  s.gap_trend_s_per_lap = -0.1;
  s.p_pit_next = 0.8;
  s.samples = 1500;
  s.seed = 99;
  return s;
}

SimulationResult at(int lap, double p) {
  SimulationResult r;
  r.lap = lap;
  r.p_undercut = p;
  return r;
}

} // namespace

TEST_CASE("scenario_at_horizon projects lap, tire age and gap") {
  auto s = scenario_at_horizon(scenario(), 3);
  REQUIRE(s.lap == 18);
  REQUIRE(s.tire_age_b == 17);
  REQUIRE(s.gap_s == Approx(0.9));
  REQUIRE(s.seed == 99);
  REQUIRE(s.samples == 1500);
}

TEST_CASE("horizon_range lists 1..H") {
  REQUIRE(horizon_range(3) == std::vector<int>{1, 2, 3});
  REQUIRE(horizon_range(0).empty());
}

TEST_CASE("each horizon equals a standalone run on the projected scenario") {
  const auto m = models();
  auto curve = simulate_multihorizon(m, scenario(), {1, 2, 3});
  REQUIRE(curve.size() == 3);
  for (int k = 1; k <= 3; ++k) {
    auto single = simulate(m, scenario_at_horizon(scenario(), k));
    REQUIRE(curve[k - 1] == single);
    REQUIRE(curve[k - 1].lap == 15 + k);
  }
}

TEST_CASE("horizons are sorted and deduplicated") {
  auto curve = simulate_multihorizon(models(), scenario(), {3, 1, 3, 0});
  REQUIRE(curve.size() == 3);
  REQUIRE(curve[0].lap == 15);
  REQUIRE(curve[1].lap == 16);
  REQUIRE(curve[2].lap == 18);
  REQUIRE(curve[0] == simulate(models(), scenario()));
}

TEST_CASE("negative horizons are rejected") {
  REQUIRE_THROWS_AS(simulate_multihorizon(models(), scenario(), {2, -1}), ValidationError);
}

TEST_CASE("best_horizon picks the highest probability, earliest on ties") {
  REQUIRE_FALSE(best_horizon({}).has_value());
  REQUIRE(best_horizon({at(10, 0.2), at(11, 0.6), at(12, 0.4)}) == 11);
  REQUIRE(best_horizon({at(10, 0.5), at(11, 0.5)}) == 10);
  REQUIRE(best_horizon({at(12, 0.5), at(11, 0.5)}) == 11);
}

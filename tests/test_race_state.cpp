#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <stdexcept>

#include <f1uc/race_state.hpp>

using Catch::Approx;
using namespace f1uc;

TEST_CASE("project_race_state ages the set and moves the gap") {
  RaceState ref{2.0, 10, -0.25};

  auto later = project_race_state(ref, 20, 24);
  REQUIRE(later.tire_age_b == 14);
  REQUIRE(later.gap_s == Approx(1.0));

  auto same = project_race_state(ref, 20, 20);
  REQUIRE(same.tire_age_b == 10);
  REQUIRE(same.gap_s == Approx(2.0));

  SECTION("tire age never goes below zero") {
    auto early = project_race_state(ref, 20, 5);
    REQUIRE(early.tire_age_b == 0);
  }
}

TEST_CASE("ProjectedRaceState ignores the pairing") {
  ProjectedRaceState p(30, RaceState{1.5, 12, 0.1});
  auto s = p.state_at("bahrain", 2024, "NOR", "VER", 32);
  REQUIRE(s.tire_age_b == 14);
  REQUIRE(s.gap_s == Approx(1.7));
}

TEST_CASE("RaceStateTable keys are normalised and unknown pairings throw") {
  RaceStateTable t;
  t.set("Bahrain", 2024, "nor", "ver", 25, RaceState{0.8, 25, 0.0});

  auto s = t.state_at(" bahrain", 2024, "NOR", "VER", 26);
  REQUIRE(s.tire_age_b == 26);
  REQUIRE(s.gap_s == Approx(0.8));

  REQUIRE_THROWS_AS(t.state_at("bahrain", 2024, "VER", "NOR", 26), std::out_of_range);
  REQUIRE_THROWS_AS(t.state_at("bahrain", 2023, "NOR", "VER", 26), std::out_of_range);
}

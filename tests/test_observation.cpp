#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <limits>
#include <sstream>
#include <string>

#include <f1uc/observation.hpp>

using Catch::Approx;
using namespace f1uc;

static Observation obs(Family f, int age, double v) {
  return Observation{f, "bahrain", 2024, Compound::Medium, age, v};
}

TEST_CASE("is_usable rejects malformed values") {
  REQUIRE(is_usable(obs(Family::Degradation, 5, 0.4)));
  REQUIRE(is_usable(obs(Family::Degradation, 0, 0.0)));

  REQUIRE_FALSE(is_usable(obs(Family::Degradation, 5, -0.1)));
  REQUIRE_FALSE(is_usable(obs(Family::Degradation, -1, 0.4)));
  REQUIRE_FALSE(is_usable(obs(Family::Degradation, 5, std::numeric_limits<double>::quiet_NaN())));
  REQUIRE_FALSE(is_usable(obs(Family::OutLap, 1, std::numeric_limits<double>::infinity())));

  SECTION("pit loss must be strictly positive") {
    REQUIRE_FALSE(is_usable(obs(Family::PitLoss, 0, 0.0)));
    REQUIRE(is_usable(obs(Family::PitLoss, 0, 22.0)));
  }

  SECTION("values above the family cap are dropped") {
    REQUIRE_FALSE(is_usable(obs(Family::Degradation, 5, value_cap(Family::Degradation) + 1.0)));
    REQUIRE_FALSE(is_usable(obs(Family::PitLoss, 0, 400.0)));
    REQUIRE_FALSE(is_usable(obs(Family::OutLap, 1, 30.0)));
  }
}

TEST_CASE("filter_usable keeps order of the usable rows") {
  std::vector<Observation> in{
    obs(Family::OutLap, 1, 0.7),
    obs(Family::OutLap, 1, -2.0),
    obs(Family::OutLap, 1, 0.9),
  };
  auto out = filter_usable(in);
  REQUIRE(out.size() == 2);
  REQUIRE(out[0].value_s == Approx(0.7));
  REQUIRE(out[1].value_s == Approx(0.9));
}

TEST_CASE("parse_family accepts canonical and short names") {
  REQUIRE(parse_family("degradation") == Family::Degradation);
  REQUIRE(parse_family("PIT") == Family::PitLoss);
  REQUIRE(parse_family("out_lap") == Family::OutLap);
  REQUIRE_FALSE(parse_family("fuel").has_value());
}

TEST_CASE("observations_from_csv_stream parses rows and skips bad ones") {
  std::istringstream ss(R"(family,circuit,season,compound,tire_age,value_s
# degradation samples
degradation, Bahrain ,2024,MEDIUM,5,0.55
pit_loss,bahrain,2024,M,0,22.4
out_lap,bahrain,2024,soft,1,0.6
out_lap,bahrain,2024,WET,1,0.6
degradation,bahrain,twenty,MEDIUM,5,0.5
degradation,bahrain,2024,MEDIUM,5

degradation,bahrain,2024,MEDIUM,6,-1.0
)");
  auto rows = observations_from_csv_stream(ss);
  REQUIRE(rows.size() == 4);

  REQUIRE(rows[0].family == Family::Degradation);
  REQUIRE(rows[0].circuit == "bahrain");
  REQUIRE(rows[0].season == 2024);
  REQUIRE(rows[0].compound == Compound::Medium);
  REQUIRE(rows[0].tire_age == 5);
  REQUIRE(rows[0].value_s == Approx(0.55));

  REQUIRE(rows[1].family == Family::PitLoss);
  REQUIRE(rows[2].compound == Compound::Soft);

  // Parsed but left for the fitter to filter.
  REQUIRE(rows[3].value_s == Approx(-1.0));
  REQUIRE_FALSE(is_usable(rows[3]));
}

TEST_CASE("load_observations_csv returns nullopt on missing file") {
  REQUIRE_FALSE(load_observations_csv("no_such_observations.csv").has_value());
}

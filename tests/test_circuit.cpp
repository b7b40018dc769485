#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>

#include <f1uc/circuit.hpp>

using Catch::Approx;
using namespace f1uc;

static std::string csv_minimal = R"(key,pit_stationary_s,pit_lane_delta_s
Bahrain,2.6,16.5
Monaco,2.5,21.5
)";

static std::string csv_with_noise = R"( key , pit_stationary_s , pit_lane_delta_s
# comment lines are ignored
Bahrain , 2.6 , 16.5
, , ,            # bad row skipped
Zandvoort, fast , 18.0
Monaco, 2.5 , 21.5
)";

TEST_CASE("circuit_pit_loss adds stationary and lane time") {
  REQUIRE(circuit_pit_loss(Circuit{"x", 2.5, 17.0}) == Approx(19.5));
  REQUIRE(circuit_pit_loss(Circuit{"x", -1.0, -10.0}) == Approx(0.0));
}

TEST_CASE("built-in catalog lookups are case-insensitive") {
  auto bah = circuit_by_key("Bahrain");
  REQUIRE(bah.has_value());
  REQUIRE(bah->key == "bahrain");
  REQUIRE(circuit_by_key("MONACO").has_value());
  REQUIRE_FALSE(circuit_by_key("atlantis").has_value());
}

TEST_CASE("circuit_catalog_from_csv_stream parses valid rows") {
  std::istringstream ss(csv_minimal);
  auto cat = circuit_catalog_from_csv_stream(ss);
  REQUIRE(cat.size() == 2);

  auto bah = circuit_by_key_in(cat, "bahrain");
  REQUIRE(bah.has_value());
  REQUIRE(bah->pit_stationary_s == Approx(2.6));
  REQUIRE(bah->pit_lane_delta_s == Approx(16.5));

  auto mon = circuit_by_key_in(cat, "Monaco");
  REQUIRE(mon.has_value());
  REQUIRE(circuit_pit_loss(*mon) == Approx(24.0));
}

TEST_CASE("circuit_catalog_from_csv_stream handles spaces, comments and bad rows") {
  std::istringstream ss(csv_with_noise);
  auto cat = circuit_catalog_from_csv_stream(ss);
  REQUIRE(cat.size() == 2);
  REQUIRE(circuit_by_key_in(cat, "Bahrain").has_value());
  REQUIRE(circuit_by_key_in(cat, "Monaco").has_value());
  REQUIRE_FALSE(circuit_by_key_in(cat, "Zandvoort").has_value());
}

TEST_CASE("load_circuit_catalog_csv returns nullopt on missing file") {
  REQUIRE_FALSE(load_circuit_catalog_csv("this_file_does_not_exist.csv").has_value());
}

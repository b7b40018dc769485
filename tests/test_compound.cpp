#include <catch2/catch_test_macros.hpp>
#include <f1uc/compound.hpp>

using namespace f1uc;

TEST_CASE("parse_compound accepts names and letters, any case") {
  REQUIRE(parse_compound("SOFT") == Compound::Soft);
  REQUIRE(parse_compound("medium") == Compound::Medium);
  REQUIRE(parse_compound("Hard") == Compound::Hard);
  REQUIRE(parse_compound("s") == Compound::Soft);
  REQUIRE(parse_compound("M") == Compound::Medium);
  REQUIRE(parse_compound("h") == Compound::Hard);
}

TEST_CASE("parse_compound rejects unknown compounds") {
  REQUIRE_FALSE(parse_compound("INTERMEDIATE").has_value());
  REQUIRE_FALSE(parse_compound("").has_value());
  REQUIRE_FALSE(parse_compound("WET").has_value());
}

TEST_CASE("compound_name round-trips through parse_compound") {
  for (auto c : {Compound::Soft, Compound::Medium, Compound::Hard}) {
    REQUIRE(parse_compound(compound_name(c)) == c);
  }
}

TEST_CASE("circuit_key trims and lower-cases") {
  REQUIRE(circuit_key("  Bahrain ") == "bahrain");
  REQUIRE(circuit_key("MONACO") == "monaco");
  REQUIRE(circuit_key("   ").empty());
}

#include <catch2/catch_test_macros.hpp>

#include <f1uc/log.hpp>

using namespace f1uc;

TEST_CASE("parse_log_level accepts level names in any case") {
  REQUIRE(parse_log_level("debug") == LogLevel::Debug);
  REQUIRE(parse_log_level("INFO") == LogLevel::Info);
  REQUIRE(parse_log_level("Warn") == LogLevel::Warn);
  REQUIRE(parse_log_level("error") == LogLevel::Error);
  REQUIRE(parse_log_level("off") == LogLevel::Off);
  REQUIRE_FALSE(parse_log_level("verbose").has_value());
}

TEST_CASE("log threshold filters lower levels") {
  const auto saved = log_level();

  set_log_level(LogLevel::Warn);
  REQUIRE_FALSE(log_enabled(LogLevel::Info));
  REQUIRE(log_enabled(LogLevel::Warn));
  REQUIRE(log_enabled(LogLevel::Error));

  set_log_level(LogLevel::Off);
  REQUIRE_FALSE(log_enabled(LogLevel::Error));

  set_log_level(saved);
}

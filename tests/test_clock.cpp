#include "flakeid/core/clock.h"
#include "flakeid/core/time.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

using namespace flakeid::core;

TEST_CASE("SystemClock reads the current Unix time in milliseconds", "[clock]") {
  SystemClock clock;
  const auto before = to_unix_millis(now_utc());
  auto reading = clock.now_unix_millis();
  const auto after = to_unix_millis(now_utc());

  REQUIRE(reading.has_value());
  CHECK(reading.value() >= static_cast<std::uint64_t>(before));
  CHECK(reading.value() <= static_cast<std::uint64_t>(after));
}

TEST_CASE("ManualClock returns the stored reading until moved", "[clock]") {
  ManualClock clock(1000);

  REQUIRE(clock.now_unix_millis().has_value());
  CHECK(clock.now_unix_millis().value() == 1000);

  clock.advance_millis(5);
  CHECK(clock.now_unix_millis().value() == 1005);

  clock.set_millis(42);
  CHECK(clock.now_unix_millis().value() == 42);
  CHECK(clock.reads() == 4);
}

TEST_CASE("format_iso8601_millis renders UTC with milliseconds", "[clock][time]") {
  CHECK(format_iso8601_millis(0) == "1970-01-01T00:00:00.000Z");
  CHECK(format_iso8601_millis(1288834974657ULL) == "2010-11-04T01:42:54.657Z");
  CHECK(format_iso8601_millis(1700000000005ULL) == "2023-11-14T22:13:20.005Z");
}

TEST_CASE("ClockError has a readable description", "[clock]") {
  CHECK(std::string(to_string(ClockError::kBeforeUnixEpoch)).find("epoch") != std::string::npos);
  CHECK(std::string(to_string(ClockError::kUnavailable)).find("unavailable") != std::string::npos);
}

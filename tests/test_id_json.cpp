#include "flakeid/snowflake/id_json.h"
#include "flakeid/snowflake/layout.h"

#include <catch2/catch_test_macros.hpp>

using namespace flakeid::snowflake;

TEST_CASE("decoded_id_to_json: every field with an epoch offset", "[json]") {
  const std::uint64_t id = compose_id(1000, 1, 2, 3);
  const auto j = decoded_id_to_json(id, kTwitterEpochMillis);

  CHECK(j.at("id") == std::to_string(id));
  CHECK(j.at("timestamp_millis") == 1000);
  CHECK(j.at("unix_millis") == kTwitterEpochMillis + 1000);
  CHECK(j.at("created_at") == "2010-11-04T01:42:55.657Z");
  CHECK(j.at("data_center_id") == 1);
  CHECK(j.at("worker_id") == 2);
  CHECK(j.at("sequence") == 3);
}

TEST_CASE("decoded_id_to_json: keys sort alphabetically", "[json]") {
  const auto dumped = decoded_id_to_json(0, 0).dump();
  CHECK(dumped ==
        R"({"created_at":"1970-01-01T00:00:00.000Z","data_center_id":0,"id":"0","sequence":0,)"
        R"("timestamp_millis":0,"unix_millis":0,"worker_id":0})");
}

TEST_CASE("generator_error_to_json: includes regression only for clock regression", "[json]") {
  const auto regression = generator_error_to_json(
      GeneratorError{GeneratorErrorKind::kClockMovedBackwards, "moved back", 12});
  CHECK(regression.at("kind") == "clock_moved_backwards");
  CHECK(regression.at("error") == "moved back");
  CHECK(regression.at("regression_millis") == 12);

  const auto invalid =
      generator_error_to_json(GeneratorError{GeneratorErrorKind::kInvalidWorkerId, "bad", 0});
  CHECK(invalid.at("kind") == "invalid_worker_id");
  CHECK_FALSE(invalid.contains("regression_millis"));
}

TEST_CASE("to_string(GeneratorErrorKind) names are stable", "[json]") {
  CHECK(std::string(to_string(GeneratorErrorKind::kInvalidWorkerId)) == "invalid_worker_id");
  CHECK(std::string(to_string(GeneratorErrorKind::kInvalidDataCenterId)) ==
        "invalid_data_center_id");
  CHECK(std::string(to_string(GeneratorErrorKind::kClockMovedBackwards)) ==
        "clock_moved_backwards");
  CHECK(std::string(to_string(GeneratorErrorKind::kClockUnavailable)) == "clock_unavailable");
  CHECK(std::string(to_string(GeneratorErrorKind::kTimestampOverflow)) == "timestamp_overflow");
}

TEST_CASE("parse_id: accepts the full unsigned 64-bit range", "[json]") {
  CHECK(parse_id("0") == std::optional<std::uint64_t>{0});
  CHECK(parse_id("18446744073709551615") == std::optional<std::uint64_t>{~0ULL});
  CHECK_FALSE(parse_id("18446744073709551616").has_value());
  CHECK_FALSE(parse_id("").has_value());
  CHECK_FALSE(parse_id("12a").has_value());
  CHECK_FALSE(parse_id(" 12").has_value());
  CHECK_FALSE(parse_id("-12").has_value());
}

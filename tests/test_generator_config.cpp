#include "flakeid/snowflake/generator_config.h"
#include "flakeid/snowflake/layout.h"

#include <catch2/catch_test_macros.hpp>

using namespace flakeid::snowflake;

// ── validate_generator_config ───────────────────────────────────────────────

TEST_CASE("validate_generator_config: in-range ids are valid", "[config]") {
  CHECK_FALSE(validate_generator_config(GeneratorConfig{}).has_value());
  CHECK_FALSE(validate_generator_config(GeneratorConfig{31, 31, 0}).has_value());
}

TEST_CASE("validate_generator_config: reports the violated bound", "[config]") {
  const auto worker = validate_generator_config(GeneratorConfig{32, 0, 0});
  REQUIRE(worker.has_value());
  CHECK(worker->kind == GeneratorErrorKind::kInvalidWorkerId);

  const auto data_center = validate_generator_config(GeneratorConfig{0, 32, 0});
  REQUIRE(data_center.has_value());
  CHECK(data_center->kind == GeneratorErrorKind::kInvalidDataCenterId);

  // Worker id is checked first.
  const auto both = validate_generator_config(GeneratorConfig{40, 40, 0});
  REQUIRE(both.has_value());
  CHECK(both->kind == GeneratorErrorKind::kInvalidWorkerId);
}

// ── JSON load/store ─────────────────────────────────────────────────────────

TEST_CASE("generator_config_to_json: sorted keys, deterministic", "[config][json]") {
  const GeneratorConfig config{3, 7, 1288834974657ULL};
  CHECK(generator_config_to_json(config) ==
        R"({"data_center_id":7,"epoch_offset_millis":1288834974657,"worker_id":3})");
}

TEST_CASE("generator_config_from_json: reads all fields", "[config][json]") {
  const auto result = generator_config_from_json(
      R"({"worker_id": 5, "data_center_id": 9, "epoch_offset_millis": 1000})");
  REQUIRE(result.has_value());
  CHECK(result.value() == GeneratorConfig{5, 9, 1000});
}

TEST_CASE("generator_config_from_json: absent keys keep defaults", "[config][json]") {
  const auto result = generator_config_from_json(R"({"worker_id": 4})");
  REQUIRE(result.has_value());
  CHECK(result.value() == GeneratorConfig{4, 0, 0});

  const auto empty = generator_config_from_json("{}");
  REQUIRE(empty.has_value());
  CHECK(empty.value() == GeneratorConfig{});
}

TEST_CASE("generator_config_from_json: store then load preserves the config", "[config][json]") {
  const GeneratorConfig config{31, 1, kTwitterEpochMillis};
  const auto loaded = generator_config_from_json(generator_config_to_json(config));
  REQUIRE(loaded.has_value());
  CHECK(loaded.value() == config);
}

TEST_CASE("generator_config_from_json: rejects malformed input", "[config][json]") {
  CHECK_FALSE(generator_config_from_json("not json").has_value());
  CHECK_FALSE(generator_config_from_json("[1, 2]").has_value());
  CHECK_FALSE(generator_config_from_json(R"({"worker_id": -1})").has_value());
  CHECK_FALSE(generator_config_from_json(R"({"worker_id": "3"})").has_value());
  CHECK_FALSE(generator_config_from_json(R"({"data_center_id": 1.5})").has_value());
  CHECK_FALSE(generator_config_from_json(R"({"worker_id": 4294967296})").has_value());

  const auto negative = generator_config_from_json(R"({"epoch_offset_millis": -5})");
  REQUIRE_FALSE(negative.has_value());
  CHECK(negative.error() == "'epoch_offset_millis' must not be negative");
}

TEST_CASE("generator_config_from_json: range checks are left to validation", "[config][json]") {
  const auto result = generator_config_from_json(R"({"worker_id": 32})");
  REQUIRE(result.has_value());
  CHECK(validate_generator_config(result.value()).has_value());
}

// ── parse_epoch_offset ──────────────────────────────────────────────────────

TEST_CASE("parse_epoch_offset: numbers and the twitter preset", "[config]") {
  CHECK(parse_epoch_offset("0") == std::optional<std::uint64_t>{0});
  CHECK(parse_epoch_offset("1700000000000") == std::optional<std::uint64_t>{1700000000000ULL});
  CHECK(parse_epoch_offset("twitter") == std::optional<std::uint64_t>{kTwitterEpochMillis});
}

TEST_CASE("parse_epoch_offset: rejects everything else", "[config]") {
  CHECK_FALSE(parse_epoch_offset("").has_value());
  CHECK_FALSE(parse_epoch_offset("-1").has_value());
  CHECK_FALSE(parse_epoch_offset("12ms").has_value());
  CHECK_FALSE(parse_epoch_offset("Twitter").has_value());
  CHECK_FALSE(parse_epoch_offset("99999999999999999999").has_value());
}

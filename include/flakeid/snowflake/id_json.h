#pragma once

#include "flakeid/snowflake/generator_error.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace flakeid::snowflake {

// decoded_id_to_json renders an identifier and its fields. Keys sort alphabetically:
//   created_at        ISO 8601 UTC with milliseconds
//   data_center_id
//   id                decimal string (JSON numbers above 2^53 lose precision in many readers)
//   sequence
//   timestamp_millis  relative to epoch_offset_millis
//   unix_millis
//   worker_id
[[nodiscard]] nlohmann::json decoded_id_to_json(std::uint64_t id,
                                                std::uint64_t epoch_offset_millis);

// generator_error_to_json renders {"error": message, "kind": to_string(kind)} and, for clock
// regressions, "regression_millis".
[[nodiscard]] nlohmann::json generator_error_to_json(const GeneratorError& error);

// parse_id accepts a decimal string of at most 20 digits that fits in 64 bits.
[[nodiscard]] std::optional<std::uint64_t> parse_id(const std::string& text);

}  // namespace flakeid::snowflake

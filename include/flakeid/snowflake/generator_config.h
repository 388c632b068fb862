#pragma once

#include "flakeid/core/result.h"
#include "flakeid/snowflake/generator_error.h"

#include <cstdint>
#include <optional>
#include <string>

namespace flakeid::snowflake {

// GeneratorConfig is the static, out-of-band assignment of one generator instance.
// Every field has an explicit default.
struct GeneratorConfig {
  std::uint32_t worker_id{0};            // NOLINT(readability-identifier-naming)
  std::uint32_t data_center_id{0};       // NOLINT(readability-identifier-naming)
  std::uint64_t epoch_offset_millis{0};  // NOLINT(readability-identifier-naming)

  bool operator==(const GeneratorConfig&) const = default;
};

// validate_generator_config checks the worker and data center ranges.
// Returns nullopt when valid, otherwise the first violated bound (worker id checked first).
[[nodiscard]] std::optional<GeneratorError> validate_generator_config(
    const GeneratorConfig& config);

// generator_config_to_json serializes a config with sorted keys. Output is deterministic.
[[nodiscard]] std::string generator_config_to_json(const GeneratorConfig& config);

// generator_config_from_json parses a JSON object. Absent keys keep their defaults.
// Returns an error message when the text is not a JSON object or a field is not a
// non-negative integer in range for its type. Range validation against the bit layout is
// left to validate_generator_config.
[[nodiscard]] core::Result<GeneratorConfig, std::string> generator_config_from_json(
    const std::string& json_str);

// parse_epoch_offset accepts a decimal millisecond count or the preset name "twitter".
[[nodiscard]] std::optional<std::uint64_t> parse_epoch_offset(const std::string& value);

}  // namespace flakeid::snowflake

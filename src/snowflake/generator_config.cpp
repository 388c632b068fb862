#include "flakeid/snowflake/generator_config.h"

#include "flakeid/core/parse.h"
#include "flakeid/snowflake/layout.h"

#include <nlohmann/json.hpp>

#include <limits>
#include <string>

namespace flakeid::snowflake {

namespace {

using json = nlohmann::json;

// Reads an optional unsigned field. Returns an error message on a type or range mismatch.
template <typename T>
std::optional<std::string> read_unsigned(const json& j, const char* key, T& out) {
  if (!j.contains(key)) {
    return std::nullopt;
  }
  const json& field = j.at(key);
  if (!field.is_number_integer()) {
    return std::string("'") + key + "' must be an integer";
  }
  if (field.is_number_unsigned()) {
    const auto value = field.get<std::uint64_t>();
    if (value > std::numeric_limits<T>::max()) {
      return std::string("'") + key + "' is out of range";
    }
    out = static_cast<T>(value);
    return std::nullopt;
  }
  const auto value = field.get<std::int64_t>();
  if (value < 0) {
    return std::string("'") + key + "' must not be negative";
  }
  if (static_cast<std::uint64_t>(value) > std::numeric_limits<T>::max()) {
    return std::string("'") + key + "' is out of range";
  }
  out = static_cast<T>(value);
  return std::nullopt;
}

}  // namespace

std::optional<GeneratorError> validate_generator_config(const GeneratorConfig& config) {
  if (config.worker_id > kMaxWorkerId) {
    return GeneratorError{GeneratorErrorKind::kInvalidWorkerId,
                          "worker id must be between 0 - " + std::to_string(kMaxWorkerId) +
                              ", got " + std::to_string(config.worker_id)};
  }
  if (config.data_center_id > kMaxDataCenterId) {
    return GeneratorError{GeneratorErrorKind::kInvalidDataCenterId,
                          "data center id must be between 0 - " +
                              std::to_string(kMaxDataCenterId) + ", got " +
                              std::to_string(config.data_center_id)};
  }
  return std::nullopt;
}

std::string generator_config_to_json(const GeneratorConfig& config) {
  // nlohmann::json default object type is std::map, so keys sort alphabetically.
  json j;
  j["data_center_id"] = config.data_center_id;
  j["epoch_offset_millis"] = config.epoch_offset_millis;
  j["worker_id"] = config.worker_id;
  return j.dump();
}

core::Result<GeneratorConfig, std::string> generator_config_from_json(const std::string& json_str) {
  using ConfigResult = core::Result<GeneratorConfig, std::string>;

  const json j = json::parse(json_str, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    return ConfigResult::err("invalid JSON");
  }
  if (!j.is_object()) {
    return ConfigResult::err("generator config must be a JSON object");
  }

  GeneratorConfig config;
  if (auto error = read_unsigned(j, "worker_id", config.worker_id)) {
    return ConfigResult::err(*error);
  }
  if (auto error = read_unsigned(j, "data_center_id", config.data_center_id)) {
    return ConfigResult::err(*error);
  }
  if (auto error = read_unsigned(j, "epoch_offset_millis", config.epoch_offset_millis)) {
    return ConfigResult::err(*error);
  }
  return ConfigResult::ok(config);
}

std::optional<std::uint64_t> parse_epoch_offset(const std::string& value) {
  if (value == "twitter") {
    return kTwitterEpochMillis;
  }
  return core::parse_u64(value);
}

}  // namespace flakeid::snowflake

#include "flakeid/snowflake/id_json.h"

#include "flakeid/core/parse.h"
#include "flakeid/core/time.h"
#include "flakeid/snowflake/layout.h"

namespace flakeid::snowflake {

nlohmann::json decoded_id_to_json(std::uint64_t id, std::uint64_t epoch_offset_millis) {
  const SnowflakeParts parts = decode_id(id);
  const std::uint64_t unix_millis = to_unix_millis(parts, epoch_offset_millis);

  // nlohmann::json default object type is std::map, so keys sort alphabetically.
  nlohmann::json j;
  j["created_at"] = core::format_iso8601_millis(unix_millis);
  j["data_center_id"] = parts.data_center_id;
  j["id"] = std::to_string(id);
  j["sequence"] = parts.sequence;
  j["timestamp_millis"] = parts.timestamp_millis;
  j["unix_millis"] = unix_millis;
  j["worker_id"] = parts.worker_id;
  return j;
}

nlohmann::json generator_error_to_json(const GeneratorError& error) {
  nlohmann::json j;
  j["error"] = error.message;
  j["kind"] = to_string(error.kind);
  if (error.kind == GeneratorErrorKind::kClockMovedBackwards) {
    j["regression_millis"] = error.regression_millis;
  }
  return j;
}

std::optional<std::uint64_t> parse_id(const std::string& text) { return core::parse_u64(text); }

}  // namespace flakeid::snowflake

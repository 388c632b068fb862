#include "decode_id.h"

#include "flakeid/snowflake/id_json.h"

#include <cstdint>
#include <optional>
#include <string>

namespace flakeid::server::handlers {

using json = nlohmann::json;

json handle_decode_id(const json& params, ServerContext& ctx) {
  if (!params.contains("id")) {
    json error_result;
    error_result["error"] = "missing required parameter: id";
    return error_result;
  }

  const json& id_field = params.at("id");
  std::optional<std::uint64_t> id;
  if (id_field.is_string()) {
    id = snowflake::parse_id(id_field.get<std::string>());
  } else if (id_field.is_number_unsigned()) {
    id = id_field.get<std::uint64_t>();
  }

  if (!id.has_value()) {
    json error_result;
    error_result["error"] = "id must be an unsigned 64-bit integer or its decimal string";
    return error_result;
  }

  return snowflake::decoded_id_to_json(id.value(), ctx.config.epoch_offset_millis);
}

}  // namespace flakeid::server::handlers

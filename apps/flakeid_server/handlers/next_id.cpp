#include "next_id.h"

#include "flakeid/snowflake/id_json.h"

#include <string>

namespace flakeid::server::handlers {

using json = nlohmann::json;

json handle_next_id(const json& /*params*/, ServerContext& ctx) {
  auto result = ctx.generator.next_id();
  if (!result.has_value()) {
    return snowflake::generator_error_to_json(result.error());
  }

  json out;
  out["id"] = std::to_string(result.value());
  out["id_u64"] = result.value();
  return out;
}

json handle_next_ids(const json& params, ServerContext& ctx) {
  const json count_field = params.value("count", json(1));
  if (!count_field.is_number_integer()) {
    json error_result;
    error_result["error"] = "count must be an integer";
    return error_result;
  }

  const auto count = count_field.get<std::int64_t>();
  if (count < 1 || count > kMaxBatchSize) {
    json error_result;
    error_result["error"] = "count must be between 1 and " + std::to_string(kMaxBatchSize);
    return error_result;
  }

  json ids = json::array();
  for (std::int64_t i = 0; i < count; ++i) {
    auto result = ctx.generator.next_id();
    if (!result.has_value()) {
      return snowflake::generator_error_to_json(result.error());
    }
    ids.push_back(std::to_string(result.value()));
  }

  json out;
  out["ids"] = std::move(ids);
  return out;
}

}  // namespace flakeid::server::handlers

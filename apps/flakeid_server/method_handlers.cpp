#include "method_handlers.h"

#include "flakeid/core/version.h"

#include "handlers/next_id.h"
#include "handlers/tool_registry.h"

namespace flakeid::server {

using json = nlohmann::json;

json handle_initialize(const JsonRpcRequest& /*req*/, ServerContext& ctx) {
  return json{
      {"protocolVersion", kProtocolVersion},
      {"capabilities", {{"tools", json::object()}}},
      {"serverInfo", {{"name", "flakeid"}, {"version", core::kBuildVersion}}},
      {"generator",
       {
           {"worker_id", ctx.config.worker_id},
           {"data_center_id", ctx.config.data_center_id},
           {"epoch_offset_millis", ctx.config.epoch_offset_millis},
       }},
  };
}

json handle_tools_list(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  json tools = json::array();

  tools.push_back({
      {"name", "next_id"},
      {"description", "Issue one Snowflake ID"},
      {"inputSchema", {{"type", "object"}, {"properties", json::object()}}},
  });

  tools.push_back({
      {"name", "next_ids"},
      {"description", "Issue a batch of strictly increasing Snowflake IDs"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties",
            {
                {"count",
                 {{"type", "integer"},
                  {"minimum", 1},
                  {"maximum", handlers::kMaxBatchSize},
                  {"description", "Number of IDs (default: 1)"}}},
            }},
       }},
  });

  tools.push_back({
      {"name", "decode_id"},
      {"description", "Split a Snowflake ID into timestamp, data center, worker and sequence"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties",
            {
                {"id", {{"type", json::array({"string", "integer"})}}},
            }},
           {"required", json::array({"id"})},
       }},
  });

  return json{{"tools", tools}};
}

json handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx) {
  std::string tool_name = req.params.value("name", "");
  json tool_params = req.params.value("arguments", json::object());

  // Tool registry
  static const auto tool_registry = handlers::build_tool_registry();

  auto it = tool_registry.find(tool_name);
  if (it == tool_registry.end()) {
    json error_result;
    error_result["error"] = "Unknown tool: " + tool_name;
    return error_result;
  }

  return it->second(tool_params, ctx);
}

std::unordered_map<std::string, MethodHandler> build_method_registry() {
  return {
      {"initialize", handle_initialize},
      {"tools/list", handle_tools_list},
      {"tools/call", handle_tools_call},
  };
}

}  // namespace flakeid::server

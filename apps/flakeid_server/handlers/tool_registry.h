#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace flakeid::server::handlers {

// A tool receives the call's "arguments" object and returns its result object.
using ToolHandler =
    std::function<nlohmann::json(const nlohmann::json& arguments, ServerContext& ctx)>;

// build_tool_registry maps next_id, next_ids and decode_id to their handlers.
std::unordered_map<std::string, ToolHandler> build_tool_registry();

}  // namespace flakeid::server::handlers

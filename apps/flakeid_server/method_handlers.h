#pragma once

#include <nlohmann/json.hpp>

#include "rpc_protocol.h"
#include "server_context.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace flakeid::server {

constexpr const char* kProtocolVersion = "2024-11-05";

using MethodHandler = std::function<nlohmann::json(const JsonRpcRequest& req, ServerContext& ctx)>;

// initialize: protocol version, server name/version, and the generator's identity
// (worker_id, data_center_id, epoch_offset_millis) so clients can decode what they receive.
nlohmann::json handle_initialize(const JsonRpcRequest& req, ServerContext& ctx);

nlohmann::json handle_tools_list(const JsonRpcRequest& req, ServerContext& ctx);

// tools/call: params {"name": <tool>, "arguments": {...}}. Tool-level failures are returned as
// {"error": ...} results, not JSON-RPC errors.
nlohmann::json handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx);

std::unordered_map<std::string, MethodHandler> build_method_registry();

}  // namespace flakeid::server

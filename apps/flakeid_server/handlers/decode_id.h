#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace flakeid::server::handlers {

// Accepts "id" as a decimal string or a non-negative JSON integer.
// Decodes with the server's configured epoch offset.
nlohmann::json handle_decode_id(const nlohmann::json& params, ServerContext& ctx);

}  // namespace flakeid::server::handlers

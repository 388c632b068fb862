#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"
#include <cstdint>

namespace flakeid::server::handlers {

// Upper bound on next_ids.count: one millisecond's worth of sequence space.
constexpr std::int64_t kMaxBatchSize = 4096;

nlohmann::json handle_next_id(const nlohmann::json& params, ServerContext& ctx);
nlohmann::json handle_next_ids(const nlohmann::json& params, ServerContext& ctx);

}  // namespace flakeid::server::handlers

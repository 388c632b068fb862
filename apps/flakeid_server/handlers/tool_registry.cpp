#include "tool_registry.h"

#include "decode_id.h"
#include "next_id.h"

namespace flakeid::server::handlers {

std::unordered_map<std::string, ToolHandler> build_tool_registry() {
  return {
      {"next_id", handle_next_id},
      {"next_ids", handle_next_ids},
      {"decode_id", handle_decode_id},
  };
}

}  // namespace flakeid::server::handlers

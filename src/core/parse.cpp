#include "flakeid/core/parse.h"

#include <stdexcept>

namespace flakeid::core {

std::optional<std::uint64_t> parse_u64(const std::string& text) {
  if (text.empty() || text.size() > 20) {
    return std::nullopt;
  }

  // Validate: all characters must be decimal digits.
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }

  try {
    return std::stoull(text);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

}  // namespace flakeid::core

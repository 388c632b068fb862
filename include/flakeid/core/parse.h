#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace flakeid::core {

// parse_u64 accepts a non-empty string of decimal digits whose value fits in 64 bits.
// Rejects signs, whitespace, and any other character.
[[nodiscard]] std::optional<std::uint64_t> parse_u64(const std::string& text);

}  // namespace flakeid::core

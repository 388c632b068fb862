#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace flakeid::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

// format_iso8601_millis renders Unix milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC).
[[nodiscard]] std::string format_iso8601_millis(std::uint64_t unix_millis);

}  // namespace flakeid::core

#include "flakeid/core/clock.h"

#include "flakeid/core/time.h"

namespace flakeid::core {

Result<std::uint64_t, ClockError> SystemClock::now_unix_millis() {
  const std::int64_t millis = to_unix_millis(now_utc());
  if (millis < 0) {
    return Result<std::uint64_t, ClockError>::err(ClockError::kBeforeUnixEpoch);
  }
  return Result<std::uint64_t, ClockError>::ok(static_cast<std::uint64_t>(millis));
}

Result<std::uint64_t, ClockError> ManualClock::now_unix_millis() {
  ++reads_;
  return Result<std::uint64_t, ClockError>::ok(unix_millis_);
}

}  // namespace flakeid::core

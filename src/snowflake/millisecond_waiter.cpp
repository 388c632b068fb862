#include "flakeid/snowflake/millisecond_waiter.h"

#include <thread>

namespace flakeid::snowflake {

core::Result<std::uint64_t, core::ClockError> SleepPollWaiter::wait_past(
    core::IClock& clock, std::uint64_t threshold_unix_millis) {
  while (true) {
    auto reading = clock.now_unix_millis();
    if (!reading.has_value() || reading.value() > threshold_unix_millis) {
      return reading;
    }
    std::this_thread::sleep_for(poll_interval_);
  }
}

}  // namespace flakeid::snowflake

#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/core/result.h"

#include <chrono>
#include <cstdint>

namespace flakeid::snowflake {

// IMillisecondWaiter blocks until a clock moves past a given millisecond.
// The generator calls it only when the sequence space of the current millisecond is exhausted.
class IMillisecondWaiter {
 public:
  virtual ~IMillisecondWaiter() = default;

  // Poll `clock` until it returns a reading strictly greater than threshold_unix_millis,
  // and return that reading. Clock errors end the wait and are returned unchanged.
  virtual core::Result<std::uint64_t, core::ClockError> wait_past(
      core::IClock& clock, std::uint64_t threshold_unix_millis) = 0;

 protected:
  IMillisecondWaiter() = default;
  IMillisecondWaiter(const IMillisecondWaiter&) = default;
  IMillisecondWaiter& operator=(const IMillisecondWaiter&) = default;
  IMillisecondWaiter(IMillisecondWaiter&&) = default;
  IMillisecondWaiter& operator=(IMillisecondWaiter&&) = default;
};

// SleepPollWaiter re-reads the clock, sleeping poll_interval between reads.
// The wait is bounded by real time only; there is no timeout or cancellation.
class SleepPollWaiter final : public IMillisecondWaiter {
 public:
  static constexpr std::chrono::microseconds kDefaultPollInterval{100};

  explicit SleepPollWaiter(std::chrono::microseconds poll_interval = kDefaultPollInterval)
      : poll_interval_(poll_interval) {}
  ~SleepPollWaiter() override = default;

  SleepPollWaiter(const SleepPollWaiter&) = default;
  SleepPollWaiter& operator=(const SleepPollWaiter&) = default;
  SleepPollWaiter(SleepPollWaiter&&) = default;
  SleepPollWaiter& operator=(SleepPollWaiter&&) = default;

  core::Result<std::uint64_t, core::ClockError> wait_past(
      core::IClock& clock, std::uint64_t threshold_unix_millis) override;

  [[nodiscard]] std::chrono::microseconds poll_interval() const { return poll_interval_; }

 private:
  std::chrono::microseconds poll_interval_;
};

}  // namespace flakeid::snowflake

#pragma once

#include "flakeid/core/result.h"

#include <cstdint>

namespace flakeid::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests/demos control time explicitly.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return milliseconds since the Unix epoch (UTC).
  // Contract: either a reading or a ClockError, never a silently clamped value.
  virtual Result<std::uint64_t, ClockError> now_unix_millis() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: reads std::chrono::system_clock.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  Result<std::uint64_t, ClockError> now_unix_millis() override;
};

// Manual clock: returns the stored reading until it is moved with set_millis/advance_millis.
// For deterministic tests and demos. Not thread-safe.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(std::uint64_t unix_millis) : unix_millis_(unix_millis) {}
  ~ManualClock() override = default;

  ManualClock(const ManualClock&) = default;
  ManualClock& operator=(const ManualClock&) = default;
  ManualClock(ManualClock&&) = default;
  ManualClock& operator=(ManualClock&&) = default;

  Result<std::uint64_t, ClockError> now_unix_millis() override;

  void set_millis(std::uint64_t unix_millis) { unix_millis_ = unix_millis; }
  void advance_millis(std::uint64_t delta) { unix_millis_ += delta; }

  // Number of readings taken so far.
  [[nodiscard]] std::uint64_t reads() const { return reads_; }

 private:
  std::uint64_t unix_millis_;
  std::uint64_t reads_{0};
};

}  // namespace flakeid::core

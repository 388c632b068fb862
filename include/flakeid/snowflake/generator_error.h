#pragma once

#include <cstdint>
#include <string>

namespace flakeid::snowflake {

enum class GeneratorErrorKind {
  kInvalidWorkerId,
  kInvalidDataCenterId,
  kClockMovedBackwards,
  kClockUnavailable,
  kTimestampOverflow,
};

// GeneratorError is the error half of every fallible generator operation.
// regression_millis is non-zero only for kClockMovedBackwards.
struct GeneratorError {
  GeneratorErrorKind kind;             // NOLINT(readability-identifier-naming)
  std::string message;                 // NOLINT(readability-identifier-naming)
  std::uint64_t regression_millis{0};  // NOLINT(readability-identifier-naming)
};

// to_string returns a stable snake_case name for logs and JSON payloads.
[[nodiscard]] const char* to_string(GeneratorErrorKind kind);

}  // namespace flakeid::snowflake

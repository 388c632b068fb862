#include "flakeid/snowflake/generator_error.h"

namespace flakeid::snowflake {

const char* to_string(GeneratorErrorKind kind) {
  switch (kind) {
    case GeneratorErrorKind::kInvalidWorkerId:
      return "invalid_worker_id";
    case GeneratorErrorKind::kInvalidDataCenterId:
      return "invalid_data_center_id";
    case GeneratorErrorKind::kClockMovedBackwards:
      return "clock_moved_backwards";
    case GeneratorErrorKind::kClockUnavailable:
      return "clock_unavailable";
    case GeneratorErrorKind::kTimestampOverflow:
      return "timestamp_overflow";
  }
  return "unknown";
}

}  // namespace flakeid::snowflake

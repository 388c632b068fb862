#include "startup_guard.h"

#include "flakeid/snowflake/layout.h"

namespace flakeid::server {

std::string validate_generator_startup(const snowflake::GeneratorConfig& config,
                                       core::IClock& clock) {
  if (auto error = snowflake::validate_generator_config(config); error.has_value()) {
    return "Error: " + error->message;
  }

  const auto now = clock.now_unix_millis();
  if (!now.has_value()) {
    return std::string("Error: cannot read the system clock: ") + core::to_string(now.error());
  }

  if (now.value() < config.epoch_offset_millis) {
    return "Error: --epoch " + std::to_string(config.epoch_offset_millis) +
           " is in the future (now: " + std::to_string(now.value()) +
           ").\n"
           "       Every request would fail. Pass an epoch at or before the current time.";
  }

  if (now.value() - config.epoch_offset_millis > snowflake::kMaxTimestamp) {
    return "Error: --epoch " + std::to_string(config.epoch_offset_millis) +
           " is too far in the past; the timestamp no longer fits in " +
           std::to_string(snowflake::kTimestampBits) + " bits.";
  }

  return "";
}

}  // namespace flakeid::server

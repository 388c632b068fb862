#include "flakeid/snowflake/snowflake_generator.h"

#include "flakeid/snowflake/layout.h"

#include <string>
#include <utility>

namespace flakeid::snowflake {

namespace {

using IdResult = core::Result<std::uint64_t, GeneratorError>;

GeneratorError clock_unavailable(core::ClockError error) {
  return GeneratorError{GeneratorErrorKind::kClockUnavailable,
                        std::string("Can't get current timestamp: ") + core::to_string(error)};
}

// Converts a raw clock reading to the offset-adjusted timeline.
IdResult adjust_for_epoch(const core::Result<std::uint64_t, core::ClockError>& reading,
                          std::uint64_t epoch_offset_millis) {
  if (!reading.has_value()) {
    return IdResult::err(clock_unavailable(reading.error()));
  }
  if (reading.value() < epoch_offset_millis) {
    return IdResult::err(GeneratorError{
        GeneratorErrorKind::kClockUnavailable,
        "Clock reading " + std::to_string(reading.value()) + " is before the epoch offset " +
            std::to_string(epoch_offset_millis)});
  }
  return IdResult::ok(reading.value() - epoch_offset_millis);
}

}  // namespace

SnowflakeGenerator::CreateResult SnowflakeGenerator::create(std::uint32_t worker_id,
                                                            std::uint32_t data_center_id,
                                                            std::uint64_t epoch_offset_millis) {
  // Both are stateless; one instance serves every generator in the process.
  static core::SystemClock system_clock;
  static SleepPollWaiter default_waiter;
  return create(worker_id, data_center_id, epoch_offset_millis, system_clock, default_waiter);
}

SnowflakeGenerator::CreateResult SnowflakeGenerator::create(std::uint32_t worker_id,
                                                            std::uint32_t data_center_id,
                                                            std::uint64_t epoch_offset_millis,
                                                            core::IClock& clock,
                                                            IMillisecondWaiter& waiter) {
  return create(GeneratorConfig{worker_id, data_center_id, epoch_offset_millis}, clock, waiter);
}

SnowflakeGenerator::CreateResult SnowflakeGenerator::create(const GeneratorConfig& config,
                                                            core::IClock& clock,
                                                            IMillisecondWaiter& waiter) {
  if (auto error = validate_generator_config(config); error.has_value()) {
    return CreateResult::err(std::move(error.value()));
  }

  auto seed = adjust_for_epoch(clock.now_unix_millis(), config.epoch_offset_millis);
  if (!seed.has_value()) {
    return CreateResult::err(seed.error());
  }

  return CreateResult::ok(SnowflakeGenerator(config, seed.value(), clock, waiter));
}

SnowflakeGenerator::SnowflakeGenerator(const GeneratorConfig& config,
                                       std::uint64_t seed_timestamp_millis, core::IClock& clock,
                                       IMillisecondWaiter& waiter)
    : worker_id_(config.worker_id),
      data_center_id_(config.data_center_id),
      epoch_offset_millis_(config.epoch_offset_millis),
      last_timestamp_millis_(seed_timestamp_millis),
      clock_(&clock),
      waiter_(&waiter) {}

core::Result<std::uint64_t, GeneratorError> SnowflakeGenerator::next_id() {
  auto now_result = current_timestamp();
  if (!now_result.has_value()) {
    return now_result;
  }
  std::uint64_t now = now_result.value();

  if (now < last_timestamp_millis_) {
    const std::uint64_t regression = last_timestamp_millis_ - now;
    return IdResult::err(GeneratorError{
        GeneratorErrorKind::kClockMovedBackwards,
        "Clock moved backwards, refusing to generate id for " + std::to_string(regression) +
            " milliseconds",
        regression});
  }

  std::uint32_t sequence = 0;
  if (now == last_timestamp_millis_) {
    sequence = static_cast<std::uint32_t>((sequence_ + 1) & kSequenceMask);
    if (sequence == 0) {
      // Sequence space of this millisecond exhausted.
      auto next = wait_for_next_millisecond(last_timestamp_millis_);
      if (!next.has_value()) {
        return next;
      }
      now = next.value();
    }
  }

  if (now > kMaxTimestamp) {
    return IdResult::err(GeneratorError{
        GeneratorErrorKind::kTimestampOverflow,
        "Timestamp " + std::to_string(now) + " exceeds the " + std::to_string(kTimestampBits) +
            "-bit timestamp field; choose a later epoch offset"});
  }

  sequence_ = sequence;
  last_timestamp_millis_ = now;

  return IdResult::ok(compose_id(last_timestamp_millis_, data_center_id_, worker_id_, sequence_));
}

core::Result<std::uint64_t, GeneratorError> SnowflakeGenerator::current_timestamp() {
  return adjust_for_epoch(clock_->now_unix_millis(), epoch_offset_millis_);
}

core::Result<std::uint64_t, GeneratorError> SnowflakeGenerator::wait_for_next_millisecond(
    std::uint64_t last_timestamp_millis) {
  return adjust_for_epoch(waiter_->wait_past(*clock_, last_timestamp_millis + epoch_offset_millis_),
                          epoch_offset_millis_);
}

}  // namespace flakeid::snowflake

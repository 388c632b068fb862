#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/core/result.h"
#include "flakeid/snowflake/generator_config.h"
#include "flakeid/snowflake/generator_error.h"
#include "flakeid/snowflake/id_generator.h"
#include "flakeid/snowflake/millisecond_waiter.h"

#include <cstdint>

namespace flakeid::snowflake {

// SnowflakeGenerator issues 64-bit identifiers laid out as described in layout.h.
//
// Uniqueness: IDs are unique per (data_center_id, worker_id) as long as the clock never
// regresses and no two live generators share the pair.
// Ordering: IDs from one instance strictly increase in issuance order.
//
// Thread-safety: none. next_id() mutates last_timestamp_millis and sequence in place; callers
// sharing an instance across threads must serialize access (see LockedIdGenerator).
//
// The clock and waiter are borrowed and must outlive the generator.
class SnowflakeGenerator final : public IIdGenerator {
 public:
  using CreateResult = core::Result<SnowflakeGenerator, GeneratorError>;

  // create validates the ids, then reads the clock once to seed last_timestamp_millis.
  // Errors: kInvalidWorkerId, kInvalidDataCenterId, kClockUnavailable (clock failure or a
  // reading earlier than epoch_offset_millis).
  // This overload uses the process-wide SystemClock and a default SleepPollWaiter.
  [[nodiscard]] static CreateResult create(std::uint32_t worker_id, std::uint32_t data_center_id,
                                           std::uint64_t epoch_offset_millis);
  [[nodiscard]] static CreateResult create(std::uint32_t worker_id, std::uint32_t data_center_id,
                                           std::uint64_t epoch_offset_millis, core::IClock& clock,
                                           IMillisecondWaiter& waiter);
  [[nodiscard]] static CreateResult create(const GeneratorConfig& config, core::IClock& clock,
                                           IMillisecondWaiter& waiter);

  ~SnowflakeGenerator() override = default;

  // Move-only: a copy would reissue the same (timestamp, sequence) pairs.
  SnowflakeGenerator(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator& operator=(const SnowflakeGenerator&) = delete;
  SnowflakeGenerator(SnowflakeGenerator&&) = default;
  SnowflakeGenerator& operator=(SnowflakeGenerator&&) = default;

  // next_id returns the next identifier, or:
  // - kClockMovedBackwards when the clock reads below last_timestamp_millis (magnitude in
  //   regression_millis); state is left untouched so generation resumes once time catches up
  // - kClockUnavailable when the clock fails or reads before the epoch offset
  // - kTimestampOverflow when the offset-adjusted time no longer fits in the timestamp field
  //
  // Blocks in the waiter when all 4096 sequence values of the current millisecond are used.
  core::Result<std::uint64_t, GeneratorError> next_id() override;

  [[nodiscard]] std::uint32_t worker_id() const { return worker_id_; }
  [[nodiscard]] std::uint32_t data_center_id() const { return data_center_id_; }
  [[nodiscard]] std::uint64_t epoch_offset_millis() const { return epoch_offset_millis_; }
  [[nodiscard]] std::uint64_t last_timestamp_millis() const { return last_timestamp_millis_; }
  [[nodiscard]] std::uint32_t sequence() const { return sequence_; }

 private:
  SnowflakeGenerator(const GeneratorConfig& config, std::uint64_t seed_timestamp_millis,
                     core::IClock& clock, IMillisecondWaiter& waiter);

  // Offset-adjusted "now".
  [[nodiscard]] core::Result<std::uint64_t, GeneratorError> current_timestamp();

  // Blocks until the offset-adjusted clock is strictly past last_timestamp_millis.
  [[nodiscard]] core::Result<std::uint64_t, GeneratorError> wait_for_next_millisecond(
      std::uint64_t last_timestamp_millis);

  std::uint32_t worker_id_;
  std::uint32_t data_center_id_;
  std::uint64_t epoch_offset_millis_;
  std::uint64_t last_timestamp_millis_;
  std::uint32_t sequence_{0};
  core::IClock* clock_;
  IMillisecondWaiter* waiter_;
};

}  // namespace flakeid::snowflake

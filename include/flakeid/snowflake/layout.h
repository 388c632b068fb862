#pragma once

#include <cstdint>

namespace flakeid::snowflake {

// Identifier bit layout, most significant first:
//
//   | timestamp (42) | data center (5) | worker (5) | sequence (12) |
//
// The timestamp is milliseconds since the generator's epoch offset.
constexpr unsigned kSequenceBits = 12;
constexpr unsigned kWorkerIdBits = 5;
constexpr unsigned kDataCenterIdBits = 5;
constexpr unsigned kTimestampBits = 64 - kSequenceBits - kWorkerIdBits - kDataCenterIdBits;

constexpr unsigned kWorkerIdShift = kSequenceBits;
constexpr unsigned kDataCenterIdShift = kSequenceBits + kWorkerIdBits;
constexpr unsigned kTimestampShift = kSequenceBits + kWorkerIdBits + kDataCenterIdBits;

constexpr std::uint64_t kMaxWorkerId = (std::uint64_t{1} << kWorkerIdBits) - 1;
constexpr std::uint64_t kMaxDataCenterId = (std::uint64_t{1} << kDataCenterIdBits) - 1;
constexpr std::uint64_t kSequenceMask = (std::uint64_t{1} << kSequenceBits) - 1;
constexpr std::uint64_t kMaxTimestamp = (std::uint64_t{1} << kTimestampBits) - 1;

// Twitter's Snowflake epoch (2010-11-04T01:42:54.657Z).
constexpr std::uint64_t kTwitterEpochMillis = 1288834974657ULL;

static_assert(kTimestampShift == 22);
static_assert(kMaxWorkerId == 31 && kMaxDataCenterId == 31);
static_assert(kSequenceMask == 4095);

// SnowflakeParts is the decoded view of an identifier.
// timestamp_millis is relative to the epoch offset of the generator that issued it.
struct SnowflakeParts {
  std::uint64_t timestamp_millis{0};  // NOLINT(readability-identifier-naming)
  std::uint32_t data_center_id{0};    // NOLINT(readability-identifier-naming)
  std::uint32_t worker_id{0};         // NOLINT(readability-identifier-naming)
  std::uint32_t sequence{0};          // NOLINT(readability-identifier-naming)

  bool operator==(const SnowflakeParts&) const = default;
};

// compose_id packs the fields into an identifier. Each field is masked to its width.
[[nodiscard]] constexpr std::uint64_t compose_id(std::uint64_t timestamp_millis,
                                                 std::uint64_t data_center_id,
                                                 std::uint64_t worker_id,
                                                 std::uint64_t sequence) {
  return ((timestamp_millis & kMaxTimestamp) << kTimestampShift) |
         ((data_center_id & kMaxDataCenterId) << kDataCenterIdShift) |
         ((worker_id & kMaxWorkerId) << kWorkerIdShift) | (sequence & kSequenceMask);
}

[[nodiscard]] constexpr SnowflakeParts decode_id(std::uint64_t id) {
  return SnowflakeParts{
      id >> kTimestampShift,
      static_cast<std::uint32_t>((id >> kDataCenterIdShift) & kMaxDataCenterId),
      static_cast<std::uint32_t>((id >> kWorkerIdShift) & kMaxWorkerId),
      static_cast<std::uint32_t>(id & kSequenceMask),
  };
}

// to_unix_millis recovers the wall-clock time at which the identifier was issued.
[[nodiscard]] constexpr std::uint64_t to_unix_millis(const SnowflakeParts& parts,
                                                     std::uint64_t epoch_offset_millis) {
  return parts.timestamp_millis + epoch_offset_millis;
}

}  // namespace flakeid::snowflake

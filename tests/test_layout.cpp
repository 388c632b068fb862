#include "flakeid/snowflake/layout.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>

using namespace flakeid::snowflake;

TEST_CASE("layout constants match the documented bit widths", "[layout]") {
  STATIC_REQUIRE(kTimestampBits == 42);
  STATIC_REQUIRE(kTimestampShift == 22);
  STATIC_REQUIRE(kDataCenterIdShift == 17);
  STATIC_REQUIRE(kWorkerIdShift == 12);
  STATIC_REQUIRE(kMaxWorkerId == 31);
  STATIC_REQUIRE(kMaxDataCenterId == 31);
  STATIC_REQUIRE(kSequenceMask == 4095);
}

TEST_CASE("compose_id places each field at its shift", "[layout]") {
  CHECK(compose_id(1, 0, 0, 0) == (std::uint64_t{1} << 22));
  CHECK(compose_id(0, 1, 0, 0) == (std::uint64_t{1} << 17));
  CHECK(compose_id(0, 0, 1, 0) == (std::uint64_t{1} << 12));
  CHECK(compose_id(0, 0, 0, 1) == 1);
  CHECK(compose_id(kMaxTimestamp, kMaxDataCenterId, kMaxWorkerId, kSequenceMask) == ~0ULL);
}

TEST_CASE("compose_id masks fields wider than their slot", "[layout]") {
  // A worker id of 32 must not bleed into the data center bits.
  CHECK(compose_id(0, 0, 32, 0) == 0);
  CHECK(compose_id(0, 0, 0, 4096) == 0);
}

TEST_CASE("decode_id recovers every field", "[layout]") {
  const std::uint64_t id = compose_id(123456789, 17, 9, 4000);
  const SnowflakeParts parts = decode_id(id);
  CHECK(parts.timestamp_millis == 123456789);
  CHECK(parts.data_center_id == 17);
  CHECK(parts.worker_id == 9);
  CHECK(parts.sequence == 4000);
}

TEST_CASE("decode_id of a hand-packed id", "[layout]") {
  // ts=1000, dc=1, worker=2, seq=3, packed by hand.
  const std::uint64_t id = (std::uint64_t{1000} << 22) | (1U << 17) | (2U << 12) | 3U;
  CHECK(id == 4194443267ULL);
  const auto parts = decode_id(id);
  CHECK(parts == SnowflakeParts{1000, 1, 2, 3});
  CHECK(to_unix_millis(parts, kTwitterEpochMillis) == kTwitterEpochMillis + 1000);
}

#include "flakeid/snowflake/layout.h"
#include "flakeid/snowflake/locked_id_generator.h"
#include "flakeid/snowflake/snowflake_generator.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <set>
#include <thread>
#include <vector>

using namespace flakeid;

TEST_CASE("LockedIdGenerator hands out distinct ids to concurrent callers",
          "[snowflake][locked]") {
  auto result = snowflake::SnowflakeGenerator::create(2, 3, snowflake::kTwitterEpochMillis);
  REQUIRE(result.has_value());
  snowflake::LockedIdGenerator locked(result.value());

  constexpr int kThreads = 8;
  constexpr int kPerThread = 2000;
  std::vector<std::vector<std::uint64_t>> per_thread(kThreads);
  std::vector<int> failures(kThreads, 0);

  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      per_thread[t].reserve(kPerThread);
      for (int i = 0; i < kPerThread; ++i) {
        auto id = locked.next_id();
        if (!id.has_value()) {
          ++failures[t];
          continue;
        }
        per_thread[t].push_back(id.value());
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<std::uint64_t> all;
  for (int t = 0; t < kThreads; ++t) {
    CHECK(failures[t] == 0);
    // Each thread observes its own ids in increasing order.
    for (std::size_t i = 1; i < per_thread[t].size(); ++i) {
      REQUIRE(per_thread[t][i - 1] < per_thread[t][i]);
    }
    all.insert(per_thread[t].begin(), per_thread[t].end());
  }
  CHECK(all.size() == static_cast<std::size_t>(kThreads * kPerThread));

  const auto parts = snowflake::decode_id(*all.begin());
  CHECK(parts.worker_id == 2);
  CHECK(parts.data_center_id == 3);
}

TEST_CASE("LockedIdGenerator passes errors through unchanged", "[snowflake][locked]") {
  core::ManualClock clock(1000);
  snowflake::SleepPollWaiter waiter;
  auto result = snowflake::SnowflakeGenerator::create(0, 0, 0, clock, waiter);
  REQUIRE(result.has_value());
  snowflake::LockedIdGenerator locked(result.value());

  REQUIRE(locked.next_id().has_value());
  clock.set_millis(990);
  auto regressed = locked.next_id();
  REQUIRE_FALSE(regressed.has_value());
  CHECK(regressed.error().kind == snowflake::GeneratorErrorKind::kClockMovedBackwards);
  CHECK(regressed.error().regression_millis == 10);
}

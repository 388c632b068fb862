#pragma once

#include "flakeid/snowflake/id_generator.h"

#include <cstdint>
#include <mutex>

namespace flakeid::snowflake {

// LockedIdGenerator serializes next_id() calls to a wrapped generator.
//
// Thread-safety: Uses std::mutex for all operations (coarse-grained locking). A caller blocked
// in the wrapped generator's millisecond wait holds the lock for the duration of the wait.
// The wrapped generator is borrowed and must outlive this object.
class LockedIdGenerator final : public IIdGenerator {
 public:
  explicit LockedIdGenerator(IIdGenerator& inner) : inner_(inner) {}
  ~LockedIdGenerator() override = default;

  // Disable copy/move (mutex not copyable)
  LockedIdGenerator(const LockedIdGenerator&) = delete;
  LockedIdGenerator& operator=(const LockedIdGenerator&) = delete;
  LockedIdGenerator(LockedIdGenerator&&) = delete;
  LockedIdGenerator& operator=(LockedIdGenerator&&) = delete;

  core::Result<std::uint64_t, GeneratorError> next_id() override;

 private:
  std::mutex mutex_;
  IIdGenerator& inner_;
};

}  // namespace flakeid::snowflake

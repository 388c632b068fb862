#include "flakeid/snowflake/locked_id_generator.h"

namespace flakeid::snowflake {

core::Result<std::uint64_t, GeneratorError> LockedIdGenerator::next_id() {
  std::lock_guard<std::mutex> lock(mutex_);
  return inner_.next_id();
}

}  // namespace flakeid::snowflake

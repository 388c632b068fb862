#pragma once

#include "flakeid/core/result.h"
#include "flakeid/snowflake/generator_error.h"

#include <cstdint>

namespace flakeid::snowflake {

// Abstract ID generator interface for dependency injection.
// Lets callers depend on "something that issues IDs" without knowing whether access is
// serialized (LockedIdGenerator) or owned by a single thread (SnowflakeGenerator).
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Issue the next identifier.
  // Contract: every successful value is strictly greater than the previous one from this source.
  virtual core::Result<std::uint64_t, GeneratorError> next_id() = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

}  // namespace flakeid::snowflake

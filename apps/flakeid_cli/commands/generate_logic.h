#pragma once

#include "flakeid/snowflake/id_generator.h"

#include <cstdint>
#include <ostream>

enum class GenerateFormat {
  kPlain,  // NOLINT(readability-identifier-naming)
  kJson,   // NOLINT(readability-identifier-naming)
};

// execute_generate: issue `count` IDs from `generator` and print them to `out`.
// kPlain prints one decimal ID per line; kJson prints an array of decoded objects.
// On a generator error nothing is printed to `out`, the error goes to `err`, and 1 is returned.
// Takes only the interface type; the caller owns clock and generator construction.
int execute_generate(flakeid::snowflake::IIdGenerator& generator, std::uint64_t count,
                     GenerateFormat format, std::uint64_t epoch_offset_millis, std::ostream& out,
                     std::ostream& err);

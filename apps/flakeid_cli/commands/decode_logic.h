#pragma once

#include <cstdint>
#include <ostream>
#include <string>

// execute_decode: parse a decimal ID and print its fields as JSON to `out`.
// Returns 1 and reports to `err` when id_text is not a 64-bit decimal integer.
int execute_decode(const std::string& id_text, std::uint64_t epoch_offset_millis,
                   std::ostream& out, std::ostream& err);

#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/snowflake/generator_config.h"

#include <string>

namespace flakeid::server {

// validate_generator_startup checks startup preconditions for the ID server.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - worker_id and data_center_id are within 0-31
// - the clock can be read
// - the clock reading is not earlier than epoch_offset_millis (an epoch in the future would
//   make every request fail)
// - the offset-adjusted time fits in the timestamp field
[[nodiscard]] std::string validate_generator_startup(const snowflake::GeneratorConfig& config,
                                                     core::IClock& clock);

}  // namespace flakeid::server

#pragma once

#include "shared/arg_parser.h"
#include "shared/generator_flags.h"
#include <ostream>

namespace flakeid::server {

// ServerConfig holds all parsed startup flags for the ID server.
// Unset generator flags fall back to the --config file, then to GeneratorConfig defaults.
struct ServerConfig {
  apps::GeneratorFlags generator;  // NOLINT(readability-identifier-naming)
  bool help{false};                // NOLINT(readability-identifier-naming)
};

// parse_args parses the server's flags. The server takes no positional arguments.
apps::ParsedArgs<ServerConfig> parse_args(int argc,
                                          char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

void print_usage(std::ostream& out);

}  // namespace flakeid::server

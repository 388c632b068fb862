#pragma once

#include "flakeid/snowflake/generator_config.h"
#include "flakeid/snowflake/id_generator.h"

namespace flakeid::server {

// ServerContext holds all process-lifetime service references passed to every tool handler.
// All references must remain valid for the lifetime of run_server_loop().
// The generator must tolerate concurrent callers if handlers are ever run in parallel;
// main() wires in a LockedIdGenerator.
struct ServerContext {
  snowflake::IIdGenerator& generator;        // NOLINT(readability-identifier-naming)
  const snowflake::GeneratorConfig& config;  // NOLINT(readability-identifier-naming)
};

}  // namespace flakeid::server

#include "flakeid/core/clock.h"
#include "flakeid/core/version.h"
#include "flakeid/snowflake/locked_id_generator.h"
#include "flakeid/snowflake/millisecond_waiter.h"
#include "flakeid/snowflake/snowflake_generator.h"

#include "config.h"
#include "server_context.h"
#include "server_loop.h"
#include "startup_guard.h"
#include <iostream>
#include <string>

using namespace flakeid;

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  auto parsed = server::parse_args(argc, argv);
  if (parsed.config.help) {
    server::print_usage(std::cout);
    return 0;
  }
  if (!parsed.ok || !parsed.positional.empty()) {
    if (!parsed.positional.empty()) {
      std::cerr << "Unexpected argument: " << parsed.positional.front() << "\n";
    }
    server::print_usage(std::cerr);
    return 1;
  }
  const server::ServerConfig& config = parsed.config;

  // Validate config before emitting any startup output so no partial messages appear on error.
  auto resolved = apps::resolve_generator_config(config.generator);
  if (!resolved.has_value()) {
    std::cerr << resolved.error() << "\n";
    return 1;
  }
  const snowflake::GeneratorConfig& generator_config = resolved.value();

  core::SystemClock clock;
  const std::string startup_error = server::validate_generator_startup(generator_config, clock);
  if (!startup_error.empty()) {
    std::cerr << startup_error << "\n";
    return 1;
  }

  snowflake::SleepPollWaiter waiter;
  auto generator = snowflake::SnowflakeGenerator::create(generator_config, clock, waiter);
  if (!generator.has_value()) {
    std::cerr << "Failed to create generator: " << generator.error().message << "\n";
    return 1;
  }

  // ── Startup diagnostic block ──────────────────────────────────────────────
  std::cerr << "flakeid ID Server v" << core::kBuildVersion << "\n";
  std::cerr << "Worker:      " << generator_config.worker_id << "\n";
  std::cerr << "Data center: " << generator_config.data_center_id << "\n";
  std::cerr << "Epoch:       " << generator_config.epoch_offset_millis << " ms\n";
  if (!config.generator.worker_id.has_value() && !config.generator.config_path.has_value()) {
    std::cerr << "WARNING: No --worker or --config specified. Using worker 0 / data center "
              << generator_config.data_center_id
              << ".\n"
                 "         Two servers started this way issue COLLIDING ids.\n";
  }
  std::cerr << "Listening on stdio for JSON-RPC requests...\n";
  // ─────────────────────────────────────────────────────────────────────────

  snowflake::LockedIdGenerator locked(generator.value());
  server::ServerContext ctx{locked, generator_config};
  server::run_server_loop(ctx, std::cin, std::cout);

  return 0;
}

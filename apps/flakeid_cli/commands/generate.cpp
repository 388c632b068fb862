#include "generate.h"

#include "flakeid/core/parse.h"
#include "flakeid/snowflake/snowflake_generator.h"

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include "shared/generator_flags.h"
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr std::uint64_t kMaxCount = 1'000'000;

struct GenerateCliConfig {
  flakeid::apps::GeneratorFlags generator;
  std::uint64_t count{1};
  GenerateFormat format{GenerateFormat::kPlain};
  bool help{false};
};

}  // namespace

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<flakeid::apps::Option<GenerateCliConfig>> options = {
      {"--count", true, "Number of IDs to generate (1-1000000, default 1)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto count = flakeid::core::parse_u64(v);
         if (!count.has_value() || count.value() == 0 || count.value() > kMaxCount) {
           std::cerr << "Invalid --count: " << v << " (valid: 1-" << kMaxCount << ")\n";
           return false;
         }
         c.count = count.value();
         return true;
       }},
      {"--json", false, "Print decoded IDs as a JSON array",
       [](GenerateCliConfig& c, const std::string& /*v*/) {
         c.format = GenerateFormat::kJson;
         return true;
       }},
      {"--help", false, "Show this help",
       [](GenerateCliConfig& c, const std::string& /*v*/) {
         c.help = true;
         return true;
       }},
  };
  flakeid::apps::add_generator_options(options);
  auto parsed = flakeid::apps::parse_options(argc, argv, options, 2);

  if (parsed.config.help) {
    std::cout << "Usage: flakeid_cli generate [options]\n";
    flakeid::apps::print_options(std::cout, options);
    return 0;
  }
  if (!parsed.positional.empty()) {
    std::cerr << "Unexpected argument: " << parsed.positional.front() << "\n";
    return 1;
  }
  if (!parsed.ok || parsed.config.generator.invalid) {
    return 1;
  }
  const GenerateCliConfig& config = parsed.config;

  auto generator_config = flakeid::apps::resolve_generator_config(config.generator);
  if (!generator_config.has_value()) {
    std::cerr << generator_config.error() << "\n";
    return 1;
  }
  const auto& resolved = generator_config.value();

  auto generator = flakeid::snowflake::SnowflakeGenerator::create(
      resolved.worker_id, resolved.data_center_id, resolved.epoch_offset_millis);
  if (!generator.has_value()) {
    std::cerr << "Failed to create generator: " << generator.error().message << "\n";
    return 1;
  }

  return execute_generate(generator.value(), config.count, config.format,
                          resolved.epoch_offset_millis, std::cout, std::cerr);
}

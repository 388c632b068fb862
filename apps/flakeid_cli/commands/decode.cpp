#include "decode.h"

#include "flakeid/snowflake/generator_config.h"

#include "decode_logic.h"
#include "shared/arg_parser.h"
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr const char* kDecodeUsage = "Usage: flakeid_cli decode <id> [--epoch <ms|twitter>]\n";

struct DecodeCliConfig {
  std::uint64_t epoch_offset_millis{0};
};

}  // namespace

int cmd_decode(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<flakeid::apps::Option<DecodeCliConfig>> options = {
      {"--epoch", true, "Epoch offset the ID was generated with, in Unix ms or 'twitter'",
       [](DecodeCliConfig& c, const std::string& v) {
         const auto epoch = flakeid::snowflake::parse_epoch_offset(v);
         if (!epoch.has_value()) {
           std::cerr << "Invalid --epoch: " << v << " (valid: <unix millis>, twitter)\n";
           return false;
         }
         c.epoch_offset_millis = epoch.value();
         return true;
       }},
  };
  const auto parsed = flakeid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return 1;
  }
  if (parsed.positional.size() != 1) {
    std::cerr << kDecodeUsage;
    flakeid::apps::print_options(std::cerr, options);
    return 1;
  }

  return execute_decode(parsed.positional.front(), parsed.config.epoch_offset_millis, std::cout,
                        std::cerr);
}

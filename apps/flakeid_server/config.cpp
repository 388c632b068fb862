#include "config.h"

#include <string>
#include <vector>

namespace flakeid::server {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<ServerConfig>> build_option_registry() {
  std::vector<apps::Option<ServerConfig>> options;
  apps::add_generator_options(options);
  options.push_back({"--help", false, "Show this help", [](ServerConfig& c, const std::string&) {
                       c.help = true;
                       return true;
                     }});
  return options;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

apps::ParsedArgs<ServerConfig> parse_args(int argc,
                                          char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return apps::parse_options(argc, argv, build_option_registry());
}

void print_usage(std::ostream& out) {
  out << "Usage: flakeid_server [options]\n"
      << "Reads one JSON-RPC request per line on stdin and answers on stdout.\n";
  apps::print_options(out, build_option_registry());
}

}  // namespace flakeid::server

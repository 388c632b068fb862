#include "flakeid/core/version.h"

#include "commands/decode.h"
#include "commands/generate.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "flakeid_cli v" << flakeid::core::kBuildVersion << "\n"
            << "Usage:\n"
            << "  flakeid_cli generate [--count N] [--json] [--worker N] [--data-center N]\n"
            << "                       [--epoch <ms|twitter>] [--config <file.json>]\n"
            << "  flakeid_cli decode <id> [--epoch <ms|twitter>]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "decode") {
    return cmd_decode(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown subcommand: " << subcommand << "\n";
  print_usage();
  return 1;
}

#include <catch2/catch_test_macros.hpp>

#include "shared/arg_parser.h"
#include <sstream>
#include <string>
#include <vector>

using flakeid::apps::Option;
using flakeid::apps::ParsedArgs;

namespace {

struct ToyConfig {
  std::string name;
  int level{0};
  bool verbose{false};
};

const std::vector<Option<ToyConfig>>& toy_options() {
  static const std::vector<Option<ToyConfig>> options = {
      {"--name", true, "Name to use",
       [](ToyConfig& c, const std::string& v) {
         c.name = v;
         return true;
       }},
      {"--level", true, "Level (0-9)",
       [](ToyConfig& c, const std::string& v) {
         if (v.size() != 1 || v[0] < '0' || v[0] > '9') {
           return false;
         }
         c.level = v[0] - '0';
         return true;
       }},
      {"--verbose", false, "Chatty output",
       [](ToyConfig& c, const std::string& /*v*/) {
         c.verbose = true;
         return true;
       }},
  };
  return options;
}

ParsedArgs<ToyConfig> parse(std::vector<std::string> args, int start = 1) {
  std::vector<char*> argv;
  argv.reserve(args.size());
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  return flakeid::apps::parse_options(static_cast<int>(argv.size()), argv.data(), toy_options(),
                                      start);
}

}  // namespace

TEST_CASE("parse_options: separate and inline values", "[apps][args]") {
  const auto parsed = parse({"prog", "--name", "alpha", "--level=7", "--verbose"});
  CHECK(parsed.ok);
  CHECK(parsed.config.name == "alpha");
  CHECK(parsed.config.level == 7);
  CHECK(parsed.config.verbose);
  CHECK(parsed.positional.empty());
}

TEST_CASE("parse_options: positional arguments are kept in order", "[apps][args]") {
  const auto parsed = parse({"prog", "decode", "123", "--level", "2", "456"}, 2);
  CHECK(parsed.ok);
  CHECK(parsed.positional == std::vector<std::string>{"123", "456"});
  CHECK(parsed.config.level == 2);
}

TEST_CASE("parse_options: problems fail the parse", "[apps][args]") {
  SECTION("unknown flag") { CHECK_FALSE(parse({"prog", "--colour", "red"}).ok); }
  SECTION("missing value") { CHECK_FALSE(parse({"prog", "--name"}).ok); }
  SECTION("rejected value") { CHECK_FALSE(parse({"prog", "--level", "12"}).ok); }
  SECTION("value given to a switch") { CHECK_FALSE(parse({"prog", "--verbose=yes"}).ok); }
}

TEST_CASE("parse_options: later valid flags still apply after a failure", "[apps][args]") {
  const auto parsed = parse({"prog", "--level", "x", "--name", "beta"});
  CHECK_FALSE(parsed.ok);
  CHECK(parsed.config.name == "beta");
}

TEST_CASE("print_options: one aligned line per option", "[apps][args]") {
  std::ostringstream out;
  flakeid::apps::print_options(out, toy_options());
  CHECK(out.str() ==
        "  --name <value>   Name to use\n"
        "  --level <value>  Level (0-9)\n"
        "  --verbose        Chatty output\n");
}

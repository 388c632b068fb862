#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iomanip>
#include <iostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace flakeid::apps {

// Option is one command-line flag. Config is the app's own settings struct; the handler writes
// the parsed value into it and returns false to reject the value.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParsedArgs is the outcome of parse_options.
// ok is false if any flag was unknown, missing its value, or rejected by its handler; each such
// problem has already been reported on stderr.
template <typename Config>
struct ParsedArgs {
  Config config;                        // NOLINT(readability-identifier-naming)
  std::vector<std::string> positional;  // NOLINT(readability-identifier-naming)
  bool ok{true};                        // NOLINT(readability-identifier-naming)
};

// parse_options walks argv[start..argc-1]. Flags take their value from the next token or from
// an inline "--flag=value". Tokens not starting with '-' are collected as positional arguments,
// in order.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 1,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, true};

  std::unordered_map<std::string, const Option<Config>*> by_name;
  for (const auto& opt : options) {
    by_name[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string token = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    if (token.size() < 2 || token[0] != '-') {
      parsed.positional.push_back(token);
      continue;
    }

    std::string name = token;
    std::string value;
    bool has_inline_value = false;
    if (const auto eq = token.find('='); eq != std::string::npos) {
      name = token.substr(0, eq);
      value = token.substr(eq + 1);
      has_inline_value = true;
    }

    auto it = by_name.find(name);
    if (it == by_name.end()) {
      std::cerr << "Unknown option: " << name << "\n";
      parsed.ok = false;
      continue;
    }

    const Option<Config>& opt = *it->second;
    if (!opt.requires_value) {
      if (has_inline_value) {
        std::cerr << "Option " << name << " does not take a value\n";
        parsed.ok = false;
        continue;
      }
      parsed.ok = opt.handler(parsed.config, "") && parsed.ok;
      continue;
    }

    if (!has_inline_value) {
      if (i + 1 >= argc) {
        std::cerr << "Option " << name << " requires a value\n";
        parsed.ok = false;
        continue;
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
    parsed.ok = opt.handler(parsed.config, value) && parsed.ok;
  }

  return parsed;
}

// print_options writes one aligned "  --name <value>  description" line per option.
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  std::size_t width = 0;
  for (const auto& opt : options) {
    width = std::max(width, opt.name.size() + (opt.requires_value ? 8 : 0));
  }
  for (const auto& opt : options) {
    const std::string label = opt.name + (opt.requires_value ? " <value>" : "");
    out << "  " << std::left << std::setw(static_cast<int>(width + 2)) << label
        << opt.description << "\n";
  }
}

}  // namespace flakeid::apps

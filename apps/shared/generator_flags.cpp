#include "shared/generator_flags.h"

#include "flakeid/core/parse.h"

#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

namespace flakeid::apps {

namespace {

std::optional<std::uint32_t> parse_u32(const std::string& value) {
  const auto parsed = core::parse_u64(value);
  if (!parsed.has_value() || parsed.value() > std::numeric_limits<std::uint32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(parsed.value());
}

}  // namespace

bool handle_config_path(GeneratorFlags& flags, const std::string& value) {
  flags.config_path = value;
  return true;
}

bool handle_worker_id(GeneratorFlags& flags, const std::string& value) {
  const auto parsed = parse_u32(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid --worker: " << value << " (expected a non-negative integer)\n";
    flags.invalid = true;
    return false;
  }
  flags.worker_id = parsed;
  return true;
}

bool handle_data_center_id(GeneratorFlags& flags, const std::string& value) {
  const auto parsed = parse_u32(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid --data-center: " << value << " (expected a non-negative integer)\n";
    flags.invalid = true;
    return false;
  }
  flags.data_center_id = parsed;
  return true;
}

bool handle_epoch(GeneratorFlags& flags, const std::string& value) {
  const auto parsed = snowflake::parse_epoch_offset(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid --epoch: " << value << " (valid: <unix millis>, twitter)\n";
    flags.invalid = true;
    return false;
  }
  flags.epoch_offset_millis = parsed;
  return true;
}

core::Result<snowflake::GeneratorConfig, std::string> resolve_generator_config(
    const GeneratorFlags& flags) {
  using ConfigResult = core::Result<snowflake::GeneratorConfig, std::string>;

  if (flags.invalid) {
    return ConfigResult::err("Error: invalid generator flags (see messages above)");
  }

  snowflake::GeneratorConfig config;
  if (flags.config_path.has_value()) {
    std::ifstream file(flags.config_path.value());
    if (!file) {
      return ConfigResult::err("Error: cannot open config file: " + flags.config_path.value());
    }
    std::ostringstream contents;
    contents << file.rdbuf();

    auto loaded = snowflake::generator_config_from_json(contents.str());
    if (!loaded.has_value()) {
      return ConfigResult::err("Error: invalid config file " + flags.config_path.value() + ": " +
                               loaded.error());
    }
    config = loaded.value();
  }

  // Explicit flags override file values.
  if (flags.worker_id.has_value()) {
    config.worker_id = flags.worker_id.value();
  }
  if (flags.data_center_id.has_value()) {
    config.data_center_id = flags.data_center_id.value();
  }
  if (flags.epoch_offset_millis.has_value()) {
    config.epoch_offset_millis = flags.epoch_offset_millis.value();
  }

  if (auto error = snowflake::validate_generator_config(config); error.has_value()) {
    return ConfigResult::err("Error: " + error->message);
  }
  return ConfigResult::ok(config);
}

}  // namespace flakeid::apps

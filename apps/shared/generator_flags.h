#pragma once

#include "flakeid/core/result.h"
#include "flakeid/snowflake/generator_config.h"

#include "shared/arg_parser.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flakeid::apps {

// GeneratorFlags collects the generator-related flags shared by every app.
// Unset fields fall back to the --config file, then to GeneratorConfig defaults.
struct GeneratorFlags {
  std::optional<std::string> config_path;            // NOLINT(readability-identifier-naming)
  std::optional<std::uint32_t> worker_id;            // NOLINT(readability-identifier-naming)
  std::optional<std::uint32_t> data_center_id;       // NOLINT(readability-identifier-naming)
  std::optional<std::uint64_t> epoch_offset_millis;  // NOLINT(readability-identifier-naming)
  // Set when any flag value failed to parse; the handler has already reported it.
  bool invalid{false};  // NOLINT(readability-identifier-naming)
};

// Flag handlers, exposed for reuse by each app's option registry.
bool handle_config_path(GeneratorFlags& flags, const std::string& value);
bool handle_worker_id(GeneratorFlags& flags, const std::string& value);
bool handle_data_center_id(GeneratorFlags& flags, const std::string& value);
bool handle_epoch(GeneratorFlags& flags, const std::string& value);

// add_generator_options appends --config, --worker, --data-center and --epoch to an option
// table whose Config type exposes a `generator` member of type GeneratorFlags.
template <typename Config>
void add_generator_options(std::vector<Option<Config>>& options) {
  options.push_back({"--config", true, "JSON file with worker_id, data_center_id, "
                                       "epoch_offset_millis",
                     [](Config& c, const std::string& v) {
                       return handle_config_path(c.generator, v);
                     }});
  options.push_back({"--worker", true, "Worker id (0-31)", [](Config& c, const std::string& v) {
                       return handle_worker_id(c.generator, v);
                     }});
  options.push_back({"--data-center", true, "Data center id (0-31)",
                     [](Config& c, const std::string& v) {
                       return handle_data_center_id(c.generator, v);
                     }});
  options.push_back({"--epoch", true, "Epoch offset in Unix milliseconds, or 'twitter'",
                     [](Config& c, const std::string& v) { return handle_epoch(c.generator, v); }});
}

// resolve_generator_config merges the config file (if any) with explicit flags and validates
// the id ranges. Returns a printable error message on failure.
[[nodiscard]] core::Result<snowflake::GeneratorConfig, std::string> resolve_generator_config(
    const GeneratorFlags& flags);

}  // namespace flakeid::apps

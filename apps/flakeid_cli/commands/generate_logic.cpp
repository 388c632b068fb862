#include "generate_logic.h"

#include "flakeid/snowflake/id_json.h"

#include <nlohmann/json.hpp>

#include <vector>

int execute_generate(flakeid::snowflake::IIdGenerator& generator, std::uint64_t count,
                     GenerateFormat format, std::uint64_t epoch_offset_millis, std::ostream& out,
                     std::ostream& err) {
  std::vector<std::uint64_t> ids;
  ids.reserve(count);

  // Collect first so a mid-batch failure prints no partial output.
  for (std::uint64_t i = 0; i < count; ++i) {
    auto result = generator.next_id();
    if (!result.has_value()) {
      const auto& error = result.error();
      err << "Failed to generate id (" << flakeid::snowflake::to_string(error.kind)
          << "): " << error.message << "\n";
      return 1;
    }
    ids.push_back(result.value());
  }

  if (format == GenerateFormat::kJson) {
    nlohmann::json out_json = nlohmann::json::array();
    for (const auto id : ids) {
      out_json.push_back(flakeid::snowflake::decoded_id_to_json(id, epoch_offset_millis));
    }
    out << out_json.dump(2) << "\n";
    return 0;
  }

  for (const auto id : ids) {
    out << id << "\n";
  }
  return 0;
}

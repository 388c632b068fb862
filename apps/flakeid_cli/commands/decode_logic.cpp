#include "decode_logic.h"

#include "flakeid/snowflake/id_json.h"

int execute_decode(const std::string& id_text, std::uint64_t epoch_offset_millis,
                   std::ostream& out, std::ostream& err) {
  const auto id = flakeid::snowflake::parse_id(id_text);
  if (!id.has_value()) {
    err << "Invalid id: " << id_text << " (expected an unsigned 64-bit decimal integer)\n";
    return 1;
  }

  auto decoded = flakeid::snowflake::decoded_id_to_json(id.value(), epoch_offset_millis);
  decoded["epoch_offset_millis"] = epoch_offset_millis;
  out << decoded.dump(2) << "\n";
  return 0;
}

#include "flakeid/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace flakeid::core {

std::string format_iso8601_millis(std::uint64_t unix_millis) {
  const auto seconds = static_cast<std::time_t>(unix_millis / 1000);
  const auto millis = static_cast<unsigned>(unix_millis % 1000);

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return oss.str();
}

}  // namespace flakeid::core

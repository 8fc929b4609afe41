#include "safelayer/common/clock.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace safelayer::common {

std::string format_iso8601(const std::chrono::system_clock::time_point when) {
  const auto t = std::chrono::system_clock::to_time_t(when);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() %
      1000;
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << (millis < 0 ? millis + 1000 : millis) << 'Z';
  return out.str();
}

std::string now_iso8601() { return format_iso8601(std::chrono::system_clock::now()); }

} // namespace safelayer::common

#pragma once

#include <chrono>
#include <string>

namespace safelayer::common {

/// UTC ISO-8601 timestamp with millisecond precision, e.g. 2024-05-01T12:00:00.123Z.
[[nodiscard]] std::string format_iso8601(std::chrono::system_clock::time_point when);
[[nodiscard]] std::string now_iso8601();

} // namespace safelayer::common

#pragma once

#include <string>

namespace safelayer::common {

/// Lowercase hex SHA-256 of the given bytes.
[[nodiscard]] std::string sha256_hex(const std::string &text);

} // namespace safelayer::common

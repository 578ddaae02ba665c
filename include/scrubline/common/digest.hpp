#pragma once

#include <string>

namespace scrubline::common {

/// Lowercase hex SHA-256 of `text`.
[[nodiscard]] std::string sha256_hex(const std::string &text);

} // namespace scrubline::common

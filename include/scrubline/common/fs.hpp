#pragma once

#include "scrubline/common/result.hpp"

#include <filesystem>
#include <istream>
#include <string>

namespace scrubline::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Read a whole file. The path "-" reads standard input.
[[nodiscard]] Result<std::string> read_text(const std::string &path);
[[nodiscard]] std::string read_stream(std::istream &in);

/// Write `content` to `path`, replacing it through a temporary sibling file.
/// The path "-" writes to standard output.
[[nodiscard]] Status write_text(const std::string &path, const std::string &content);

} // namespace scrubline::common

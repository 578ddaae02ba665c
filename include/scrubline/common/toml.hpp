#pragma once

#include "scrubline/common/result.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace scrubline::common {

/// Flat view of a TOML file: every value is stored under its dotted key
/// ("section.key") as raw text and converted on access.
struct TomlDocument {
  std::map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] int get_int(const std::string &key, int fallback) const;
  [[nodiscard]] std::size_t get_size(const std::string &key, std::size_t fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;

  /// Keys directly under `section` (without the section prefix).
  [[nodiscard]] std::vector<std::string> keys_in(const std::string &section) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace scrubline::common

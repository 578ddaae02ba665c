#pragma once

#include "scrubline/common/result.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace scrubline::sanitize {

inline constexpr std::string_view kTruncationMarker = "[content truncated]";
inline constexpr std::string_view kEllipsis = "...";
inline constexpr std::string_view kHeaderPrefix = "name:";

struct RuleOptions {
  // Byte ceiling for truncate_oversize; at least 16.
  std::size_t max_length = 10000;
  // Line ceiling for truncate_oversize; 0 disables it, otherwise at least 3.
  std::size_t max_lines = 200;
};

struct Rule {
  std::string name;
  std::function<std::string(const std::string &)> apply;
};

[[nodiscard]] std::string unwrap_nested_images(const std::string &text);
[[nodiscard]] std::string close_incomplete_links(const std::string &text);
[[nodiscard]] std::string canonicalize_path_separators(const std::string &text);
[[nodiscard]] std::string decode_safe_percent(const std::string &text);
[[nodiscard]] std::string strip_images(const std::string &text);
[[nodiscard]] std::string strip_links(const std::string &text);
[[nodiscard]] std::string strip_markup(const std::string &text);
[[nodiscard]] std::string collapse_whitespace(const std::string &text);
[[nodiscard]] std::string truncate_oversize(const std::string &text, const RuleOptions &options);

/// All rules in canonical order.
[[nodiscard]] std::vector<Rule> default_rules(const RuleOptions &options = {});

/// Canonical rule names, in order.
[[nodiscard]] const std::vector<std::string> &rule_names();
[[nodiscard]] bool is_rule_name(std::string_view name);

[[nodiscard]] common::Status validate_rule_options(const RuleOptions &options);

} // namespace scrubline::sanitize

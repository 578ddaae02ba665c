#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace scrubline::analysis {

struct AnalyzerOptions {
  // Line count above which `too_many_lines` is raised; 0 disables the check.
  std::size_t line_ceiling = 200;
  // Byte length above which `oversized` is raised; 0 disables the check.
  std::size_t max_length = 10000;
};

struct MarkdownLink {
  std::string label;
  std::string target;
  bool image = false;
};

struct HazardFlags {
  bool tab_header = false;
  bool nested_image = false;
  bool doubled_backslash = false;
  bool encoded_plus = false;
  bool too_many_lines = false;
  bool incomplete_link = false;
  bool markup = false;
  bool whitespace_runs = false;
  bool oversized = false;
  // Informational only; no rule removes non-ASCII text.
  bool non_ascii = false;
};

struct HazardReport {
  std::size_t length = 0;
  std::size_t line_count = 0;
  // (vocabulary label, count) in vocabulary order, non-zero entries only.
  std::vector<std::pair<std::string, std::size_t>> char_counts;
  std::vector<std::string> urls;
  std::vector<MarkdownLink> links;
  std::set<std::string> escapes;
  std::size_t cjk_count = 0;
  HazardFlags flags;

  [[nodiscard]] bool has_links() const;
  [[nodiscard]] bool has_images() const;
  [[nodiscard]] bool has_hazards() const;
  [[nodiscard]] std::size_t count_of(std::string_view label) const;
};

/// Structural report over one message text. Never modifies the text.
[[nodiscard]] HazardReport analyze(std::string_view text, const AnalyzerOptions &options = {});

/// Names of the rules whose trigger is present in `report`, in rule order.
[[nodiscard]] std::vector<std::string> suggested_rules(const HazardReport &report);

/// Human-readable one-liners for every raised flag.
[[nodiscard]] std::vector<std::string> describe_hazards(const HazardReport &report);

} // namespace scrubline::analysis

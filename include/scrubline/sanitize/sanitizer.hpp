#pragma once

#include "scrubline/common/result.hpp"
#include "scrubline/sanitize/rules.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace scrubline::sanitize {

struct TraceEntry {
  std::string rule;
  std::size_t pass = 0;
  std::size_t length_before = 0;
  std::size_t length_after = 0;
};

struct SanitizeOptions {
  RuleOptions rules;
  // Changing passes in a row allowed without reaching a new shortest length. Only
  // close_incomplete_links and line truncation can lengthen the text.
  std::size_t max_stalled_passes = 4;
  std::vector<std::string> disabled_rules;
};

struct SanitizeResult {
  std::string text;
  std::vector<TraceEntry> trace;
  std::size_t original_length = 0;
  std::size_t passes = 0;
  // False when the stalled-pass budget ran out while the text was still
  // changing. A converged text is a fixed point of the rule set.
  bool converged = true;

  [[nodiscard]] bool changed() const { return !trace.empty(); }
  [[nodiscard]] std::size_t bytes_removed() const;
  /// Distinct rule names from the trace, in first-applied order.
  [[nodiscard]] std::vector<std::string> rules_triggered() const;
};

/// Applies an ordered rule list, repeating full passes until one changes
/// nothing. Holds no state between calls.
class Sanitizer {
public:
  explicit Sanitizer(std::vector<Rule> rules, std::size_t max_stalled_passes = 4);

  [[nodiscard]] common::Result<SanitizeResult> run(const std::string &text) const;
  [[nodiscard]] const std::vector<Rule> &rules() const { return rules_; }

private:
  std::vector<Rule> rules_;
  std::size_t max_stalled_passes_;
};

[[nodiscard]] common::Status validate_sanitize_options(const SanitizeOptions &options);

/// Default rules minus `options.disabled_rules`, in canonical order.
[[nodiscard]] std::vector<Rule> enabled_rules(const SanitizeOptions &options);

[[nodiscard]] common::Result<SanitizeResult> sanitize(const std::string &text,
                                                      const SanitizeOptions &options = {});

} // namespace scrubline::sanitize

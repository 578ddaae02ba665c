#include "scrubline/sanitize/sanitizer.hpp"

#include <algorithm>
#include <exception>

namespace scrubline::sanitize {

std::size_t SanitizeResult::bytes_removed() const {
  return original_length > text.size() ? original_length - text.size() : 0;
}

std::vector<std::string> SanitizeResult::rules_triggered() const {
  std::vector<std::string> names;
  for (const auto &entry : trace) {
    if (std::find(names.begin(), names.end(), entry.rule) == names.end()) {
      names.push_back(entry.rule);
    }
  }
  return names;
}

Sanitizer::Sanitizer(std::vector<Rule> rules, const std::size_t max_stalled_passes)
    : rules_(std::move(rules)),
      max_stalled_passes_(std::max<std::size_t>(max_stalled_passes, 1)) {}

common::Result<SanitizeResult> Sanitizer::run(const std::string &text) const {
  SanitizeResult result;
  result.text = text;
  result.original_length = text.size();
  if (text.empty()) {
    return common::Result<SanitizeResult>::success(std::move(result));
  }

  // Passes repeat until one changes nothing. A changing pass either reaches a
  // new shortest length or counts as stalled; too many stalled passes in a
  // row end the run unconverged.
  result.converged = false;
  std::size_t shortest = 0;
  std::size_t stalled = 0;
  for (std::size_t pass = 1;; ++pass) {
    result.passes = pass;
    bool changed = false;
    for (const auto &rule : rules_) {
      std::string next;
      try {
        next = rule.apply(result.text);
      } catch (const std::exception &ex) {
        return common::Result<SanitizeResult>::failure(common::ErrorKind::RuleApplicationError,
                                                       rule.name + ": " + ex.what());
      }
      if (next == result.text) {
        continue;
      }
      result.trace.push_back(TraceEntry{.rule = rule.name,
                                        .pass = pass,
                                        .length_before = result.text.size(),
                                        .length_after = next.size()});
      result.text = std::move(next);
      changed = true;
    }
    if (!changed) {
      result.converged = true;
      break;
    }
    if (pass == 1 || result.text.size() < shortest) {
      shortest = result.text.size();
      stalled = 0;
    } else if (++stalled >= max_stalled_passes_) {
      break;
    }
  }
  return common::Result<SanitizeResult>::success(std::move(result));
}

common::Status validate_sanitize_options(const SanitizeOptions &options) {
  if (auto status = validate_rule_options(options.rules); !status.ok()) {
    return status;
  }
  if (options.max_stalled_passes == 0) {
    return common::Status::error("max_stalled_passes must be at least 1");
  }
  for (const auto &name : options.disabled_rules) {
    if (!is_rule_name(name)) {
      return common::Status::error("unknown rule: " + name);
    }
  }
  return common::Status::success();
}

std::vector<Rule> enabled_rules(const SanitizeOptions &options) {
  std::vector<Rule> rules = default_rules(options.rules);
  std::erase_if(rules, [&options](const Rule &rule) {
    return std::find(options.disabled_rules.begin(), options.disabled_rules.end(), rule.name) !=
           options.disabled_rules.end();
  });
  return rules;
}

common::Result<SanitizeResult> sanitize(const std::string &text, const SanitizeOptions &options) {
  if (auto status = validate_sanitize_options(options); !status.ok()) {
    return common::Result<SanitizeResult>::failure("invalid sanitizer options: " + status.error());
  }
  return Sanitizer(enabled_rules(options), options.max_stalled_passes).run(text);
}

} // namespace scrubline::sanitize

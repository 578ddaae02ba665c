#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace scrubline::config {

struct LocatorConfig {
  std::string messages_key = "messages";
};

struct SelectorConfig {
  std::string role = "tool";
  bool all = false;
};

struct SanitizerConfig {
  std::size_t max_length = 10000;
  std::size_t max_lines = 200;
  std::size_t max_stalled_passes = 4;
  std::vector<std::string> disabled_rules;
};

struct ToolCallsConfig {
  bool normalize = true;
};

struct OutputConfig {
  int indent = 2;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  LocatorConfig locator;
  SelectorConfig selector;
  SanitizerConfig sanitizer;
  ToolCallsConfig tool_calls;
  OutputConfig output;
  ObservabilityConfig observability;
};

} // namespace scrubline::config

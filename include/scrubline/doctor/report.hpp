#pragma once

#include "scrubline/patch/patcher.hpp"
#include "scrubline/toolcalls/normalizer.hpp"

#include <json/json.h>

#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace scrubline::doctor {

enum class CheckStatus {
  Pass,
  Fail,
  Warn,
  Info,
};

struct DiagnosticCheck {
  std::string name;
  CheckStatus status = CheckStatus::Info;
  std::string message;
};

struct DiagnosticsReport {
  std::vector<DiagnosticCheck> checks;
  int passed = 0;
  int failed = 0;
  int warnings = 0;
};

[[nodiscard]] DiagnosticsReport
build_report(const patch::PatchReport &report,
             const std::optional<toolcalls::DocumentToolCallReport> &tool_calls = std::nullopt);

void print_report(const DiagnosticsReport &report, std::ostream &out = std::cout);

[[nodiscard]] Json::Value hazards_to_json(const analysis::HazardReport &hazards);

[[nodiscard]] Json::Value
report_to_json(const patch::PatchReport &report,
               const std::optional<toolcalls::DocumentToolCallReport> &tool_calls = std::nullopt);

} // namespace scrubline::doctor

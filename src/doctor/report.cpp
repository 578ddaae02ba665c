#include "scrubline/doctor/report.hpp"

#include <algorithm>

namespace scrubline::doctor {

namespace {

constexpr std::size_t kMaxListed = 5;

void add_check(DiagnosticsReport &report, DiagnosticCheck check) {
  switch (check.status) {
  case CheckStatus::Pass:
    ++report.passed;
    break;
  case CheckStatus::Fail:
    ++report.failed;
    break;
  case CheckStatus::Warn:
    ++report.warnings;
    break;
  case CheckStatus::Info:
    break;
  }
  report.checks.push_back(std::move(check));
}

std::string join(const std::vector<std::string> &items, const std::string &separator) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += items[i];
  }
  return out;
}

std::string shorten(const std::string &hash) { return hash.substr(0, 12); }

void add_message_checks(DiagnosticsReport &report, const patch::MessagePatch &message) {
  const std::string prefix = "Message " + std::to_string(message.index);
  const auto &hazards = message.hazards;

  if (message.content_shape.empty()) {
    add_check(report, {prefix, CheckStatus::Warn, "no text content"});
    return;
  }

  add_check(report, {prefix, CheckStatus::Info,
                     "role=" + std::string(document::role_name(message.role)) + ", " +
                         message.content_shape + " content, " + std::to_string(hazards.length) +
                         " bytes, " + std::to_string(hazards.line_count) + " lines"});

  const auto described = analysis::describe_hazards(hazards);
  if (described.empty()) {
    add_check(report, {prefix + " hazards", CheckStatus::Pass, "none"});
  } else {
    add_check(report, {prefix + " hazards", CheckStatus::Warn, join(described, "; ")});
    add_check(report, {prefix + " suggested rules", CheckStatus::Info,
                       join(analysis::suggested_rules(hazards), ", ")});
  }

  if (!hazards.char_counts.empty()) {
    std::vector<std::string> counts;
    for (const auto &[label, count] : hazards.char_counts) {
      counts.push_back(label + "=" + std::to_string(count));
    }
    add_check(report, {prefix + " characters", CheckStatus::Info, join(counts, " ")});
  }
  if (!hazards.urls.empty()) {
    const std::size_t shown = std::min(kMaxListed, hazards.urls.size());
    const std::vector<std::string> listed(hazards.urls.begin(),
                                          hazards.urls.begin() + static_cast<std::ptrdiff_t>(shown));
    std::string message_text = std::to_string(hazards.urls.size()) + ": " + join(listed, " ");
    if (hazards.urls.size() > kMaxListed) {
      message_text += " ...";
    }
    add_check(report, {prefix + " urls", CheckStatus::Info, message_text});
  }
  if (!hazards.escapes.empty()) {
    add_check(report, {prefix + " escapes", CheckStatus::Info,
                       join(std::vector<std::string>(hazards.escapes.begin(), hazards.escapes.end()),
                            " ")});
  }
  if (hazards.flags.non_ascii) {
    add_check(report, {prefix + " non-ascii", CheckStatus::Info,
                       std::to_string(hazards.cjk_count) + " CJK code points"});
  }

  for (const auto &entry : message.trace) {
    add_check(report, {prefix + " rule", CheckStatus::Info,
                       entry.rule + " (pass " + std::to_string(entry.pass) + "): " +
                           std::to_string(entry.length_before) + " -> " +
                           std::to_string(entry.length_after)});
  }

  if (!message.converged) {
    add_check(report, {prefix + " sanitized", CheckStatus::Warn,
                       "still changing after " + std::to_string(message.passes) + " passes"});
  } else if (message.changed()) {
    add_check(report, {prefix + " sanitized", CheckStatus::Pass,
                       std::to_string(message.length_before) + " -> " +
                           std::to_string(message.length_after) + " bytes (" +
                           std::to_string(message.bytes_removed()) + " removed), sha256 " +
                           shorten(message.sha256_before) + " -> " +
                           shorten(message.sha256_after)});
  } else {
    add_check(report, {prefix + " sanitized", CheckStatus::Pass,
                       "already clean, sha256 " + shorten(message.sha256_before)});
  }
}

} // namespace

DiagnosticsReport build_report(const patch::PatchReport &report,
                               const std::optional<toolcalls::DocumentToolCallReport> &tool_calls) {
  DiagnosticsReport out;

  if (report.status == patch::PatchStatus::NoMessagesFound) {
    add_check(out, {"Messages", CheckStatus::Warn, "not found; document passed through unchanged"});
  } else {
    add_check(out, {"Messages", CheckStatus::Pass,
                    std::to_string(report.message_count) + " at " + report.messages_path});
    if (report.status == patch::PatchStatus::NoMatchingMessage) {
      add_check(out, {"Selection", CheckStatus::Warn,
                      "no message matches " + report.selector +
                          "; document passed through unchanged"});
    } else {
      std::vector<std::string> indices;
      for (const auto &message : report.messages) {
        indices.push_back(std::to_string(message.index));
      }
      add_check(out, {"Selection", CheckStatus::Pass,
                      report.selector + " -> message " + join(indices, ", ")});
    }
  }

  for (const auto &message : report.messages) {
    add_message_checks(out, message);
  }

  if (tool_calls.has_value()) {
    if (tool_calls->notes.empty()) {
      add_check(out, {"Tool calls", CheckStatus::Pass,
                      std::to_string(tool_calls->calls_seen) + " call(s), already canonical"});
    } else {
      add_check(out, {"Tool calls", CheckStatus::Warn,
                      std::to_string(tool_calls->calls_seen) + " call(s), " +
                          std::to_string(tool_calls->messages_changed) + " message(s) rewritten"});
      for (const auto &note : tool_calls->notes) {
        add_check(out, {"Tool calls", CheckStatus::Info, note});
      }
    }
  }

  for (const auto &note : report.notes) {
    add_check(out, {"Note", CheckStatus::Info, note});
  }
  return out;
}

void print_report(const DiagnosticsReport &report, std::ostream &out) {
  const auto status_prefix = [](const CheckStatus status) {
    switch (status) {
    case CheckStatus::Pass:
      return "[PASS]";
    case CheckStatus::Fail:
      return "[FAIL]";
    case CheckStatus::Warn:
      return "[WARN]";
    case CheckStatus::Info:
      break;
    }
    return "[INFO]";
  };

  for (const auto &check : report.checks) {
    out << status_prefix(check.status) << " " << check.name << ": " << check.message << "\n";
  }

  out << "Summary: " << report.passed << " passed, " << report.failed << " failed, "
      << report.warnings << " warnings\n";
}

Json::Value hazards_to_json(const analysis::HazardReport &hazards) {
  Json::Value out(Json::objectValue);
  out["length"] = static_cast<Json::UInt64>(hazards.length);
  out["line_count"] = static_cast<Json::UInt64>(hazards.line_count);

  Json::Value counts(Json::objectValue);
  for (const auto &[label, count] : hazards.char_counts) {
    counts[label] = static_cast<Json::UInt64>(count);
  }
  out["char_counts"] = counts;

  Json::Value urls(Json::arrayValue);
  for (const auto &url : hazards.urls) {
    urls.append(url);
  }
  out["urls"] = urls;

  Json::Value links(Json::arrayValue);
  for (const auto &link : hazards.links) {
    Json::Value entry(Json::objectValue);
    entry["label"] = link.label;
    entry["target"] = link.target;
    entry["image"] = link.image;
    links.append(entry);
  }
  out["links"] = links;

  Json::Value escapes(Json::arrayValue);
  for (const auto &escape : hazards.escapes) {
    escapes.append(escape);
  }
  out["escapes"] = escapes;
  out["cjk_count"] = static_cast<Json::UInt64>(hazards.cjk_count);

  const auto &f = hazards.flags;
  Json::Value flags(Json::objectValue);
  flags["tab_header"] = f.tab_header;
  flags["nested_image"] = f.nested_image;
  flags["doubled_backslash"] = f.doubled_backslash;
  flags["encoded_plus"] = f.encoded_plus;
  flags["too_many_lines"] = f.too_many_lines;
  flags["incomplete_link"] = f.incomplete_link;
  flags["markup"] = f.markup;
  flags["whitespace_runs"] = f.whitespace_runs;
  flags["oversized"] = f.oversized;
  flags["non_ascii"] = f.non_ascii;
  out["flags"] = flags;
  out["has_hazards"] = hazards.has_hazards();

  Json::Value suggested(Json::arrayValue);
  for (const auto &rule : analysis::suggested_rules(hazards)) {
    suggested.append(rule);
  }
  out["suggested_rules"] = suggested;
  return out;
}

Json::Value report_to_json(const patch::PatchReport &report,
                           const std::optional<toolcalls::DocumentToolCallReport> &tool_calls) {
  Json::Value out(Json::objectValue);
  out["status"] = std::string(patch::patch_status_name(report.status));
  out["message_count"] = static_cast<Json::UInt64>(report.message_count);
  out["messages_path"] = report.messages_path;
  out["selector"] = report.selector;
  out["bytes_removed"] = static_cast<Json::UInt64>(report.bytes_removed());

  Json::Value messages(Json::arrayValue);
  for (const auto &message : report.messages) {
    Json::Value entry(Json::objectValue);
    entry["index"] = static_cast<Json::UInt64>(message.index);
    entry["role"] = std::string(document::role_name(message.role));
    entry["content_shape"] = message.content_shape;
    entry["length_before"] = static_cast<Json::UInt64>(message.length_before);
    entry["length_after"] = static_cast<Json::UInt64>(message.length_after);
    entry["sha256_before"] = message.sha256_before;
    entry["sha256_after"] = message.sha256_after;
    entry["passes"] = static_cast<Json::UInt64>(message.passes);
    entry["converged"] = message.converged;
    entry["hazards"] = hazards_to_json(message.hazards);

    Json::Value trace(Json::arrayValue);
    for (const auto &step : message.trace) {
      Json::Value item(Json::objectValue);
      item["rule"] = step.rule;
      item["pass"] = static_cast<Json::UInt64>(step.pass);
      item["length_before"] = static_cast<Json::UInt64>(step.length_before);
      item["length_after"] = static_cast<Json::UInt64>(step.length_after);
      trace.append(item);
    }
    entry["trace"] = trace;
    messages.append(entry);
  }
  out["messages"] = messages;

  Json::Value notes(Json::arrayValue);
  for (const auto &note : report.notes) {
    notes.append(note);
  }
  out["notes"] = notes;

  if (tool_calls.has_value()) {
    Json::Value calls(Json::objectValue);
    calls["calls_seen"] = static_cast<Json::UInt64>(tool_calls->calls_seen);
    calls["messages_changed"] = static_cast<Json::UInt64>(tool_calls->messages_changed);
    Json::Value call_notes(Json::arrayValue);
    for (const auto &note : tool_calls->notes) {
      call_notes.append(note);
    }
    calls["notes"] = call_notes;
    out["tool_calls"] = calls;
  }
  return out;
}

} // namespace scrubline::doctor

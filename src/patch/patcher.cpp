#include "scrubline/patch/patcher.hpp"

#include "scrubline/common/digest.hpp"
#include "scrubline/common/json_util.hpp"
#include "scrubline/observability/global.hpp"

#include <algorithm>
#include <chrono>

namespace scrubline::patch {

namespace {

struct PatchContext {
  const sanitize::Sanitizer &sanitizer;
  analysis::AnalyzerOptions analyzer;
};

common::Status sanitize_slot(Json::Value &slot, const PatchContext &context,
                             MessagePatch &record) {
  auto result = context.sanitizer.run(slot.asString());
  if (!result.ok()) {
    return result.status();
  }
  const auto &sanitized = result.value();
  record.passes = std::max(record.passes, sanitized.passes);
  record.converged = record.converged && sanitized.converged;
  record.trace.insert(record.trace.end(), sanitized.trace.begin(), sanitized.trace.end());
  if (sanitized.changed()) {
    common::json_assign(slot, Json::Value(sanitized.text));
  }
  return common::Status::success();
}

common::Status patch_message(Json::Value &message, const PatchContext &context,
                             MessagePatch &record, std::vector<std::string> &notes) {
  record.role = document::message_role(message);
  const auto before = document::message_text(message);
  if (!before.has_value()) {
    notes.push_back("message " + std::to_string(record.index) + " has no text content");
    return common::Status::success();
  }

  record.hazards = analysis::analyze(*before, context.analyzer);
  record.length_before = before->size();
  record.sha256_before = common::sha256_hex(*before);

  Json::Value &content = message["content"];
  if (content.isString()) {
    record.content_shape = "string";
    if (auto status = sanitize_slot(content, context, record); !status.ok()) {
      return status;
    }
  } else {
    record.content_shape = "parts";
    for (auto &part : content) {
      if (!part.isObject() || !part.isMember("text") || !part["text"].isString()) {
        continue;
      }
      if (auto status = sanitize_slot(part["text"], context, record); !status.ok()) {
        return status;
      }
    }
  }

  const std::string after = document::message_text(message).value_or("");
  record.length_after = after.size();
  record.sha256_after = record.changed() ? common::sha256_hex(after) : record.sha256_before;

  for (const auto &entry : record.trace) {
    observability::record_rule_applied(entry.rule, entry.pass, entry.length_before,
                                       entry.length_after);
  }
  if (record.changed()) {
    observability::record_message_patched(record.index,
                                          std::string(document::role_name(record.role)),
                                          record.length_before, record.length_after);
  }
  if (!record.converged) {
    notes.push_back("message " + std::to_string(record.index) + " still changing after " +
                    std::to_string(record.passes) + " passes");
  }
  return common::Status::success();
}

common::Result<PatchOutcome> run_patch(const Json::Value &document,
                                       const document::MessageSelector &selector,
                                       const PatchOptions &options, const bool all) {
  if (!selector.matches) {
    return common::Result<PatchOutcome>::failure("message selector has no predicate");
  }
  if (auto status = sanitize::validate_sanitize_options(options.sanitizer); !status.ok()) {
    return common::Result<PatchOutcome>::failure("invalid sanitizer options: " + status.error());
  }

  PatchOutcome outcome{.document = document, .report = {}};
  auto &report = outcome.report;
  report.selector = selector.description;

  const auto located = document::locate_messages(outcome.document, options.locator);
  Json::Value *messages =
      located.has_value() ? document::resolve_path(outcome.document, located->path) : nullptr;
  if (messages == nullptr) {
    report.status = PatchStatus::NoMessagesFound;
    report.notes.push_back("no '" + options.locator.messages_key + "' list of objects found");
    return common::Result<PatchOutcome>::success(std::move(outcome));
  }
  report.message_count = messages->size();
  report.messages_path = located->path.to_string();

  std::vector<std::size_t> targets;
  for (std::size_t i = messages->size(); i-- > 0;) {
    if (selector.matches((*messages)[static_cast<Json::ArrayIndex>(i)], i)) {
      targets.push_back(i);
      if (!all) {
        break;
      }
    }
  }
  if (targets.empty()) {
    report.status = PatchStatus::NoMatchingMessage;
    report.notes.push_back("no message matches " + selector.description);
    return common::Result<PatchOutcome>::success(std::move(outcome));
  }
  std::reverse(targets.begin(), targets.end());

  const sanitize::Sanitizer sanitizer(sanitize::enabled_rules(options.sanitizer),
                                      options.sanitizer.max_stalled_passes);
  const PatchContext context{
      .sanitizer = sanitizer,
      .analyzer = analysis::AnalyzerOptions{.line_ceiling = options.sanitizer.rules.max_lines,
                                            .max_length = options.sanitizer.rules.max_length},
  };

  const auto started = std::chrono::steady_clock::now();
  for (const std::size_t index : targets) {
    MessagePatch record;
    record.index = index;
    auto status = patch_message((*messages)[static_cast<Json::ArrayIndex>(index)], context,
                                record, report.notes);
    if (!status.ok()) {
      observability::record_error("patcher", status.error());
      return common::Result<PatchOutcome>::failure(status);
    }
    report.messages.push_back(std::move(record));
  }
  observability::record_sanitize_latency(std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - started));

  const bool changed = std::any_of(report.messages.begin(), report.messages.end(),
                                   [](const MessagePatch &m) { return m.changed(); });
  report.status = changed ? PatchStatus::Patched : PatchStatus::Unchanged;
  if (changed) {
    observability::record_bytes_removed(report.bytes_removed());
  }
  return common::Result<PatchOutcome>::success(std::move(outcome));
}

} // namespace

std::string_view patch_status_name(const PatchStatus status) {
  switch (status) {
  case PatchStatus::Patched:
    return "patched";
  case PatchStatus::Unchanged:
    return "unchanged";
  case PatchStatus::NoMessagesFound:
    return "no_messages_found";
  case PatchStatus::NoMatchingMessage:
    return "no_matching_message";
  }
  return "unknown";
}

std::size_t PatchReport::bytes_removed() const {
  std::size_t total = 0;
  for (const auto &message : messages) {
    total += message.bytes_removed();
  }
  return total;
}

common::Result<PatchOutcome> patch(const Json::Value &document,
                                   const document::MessageSelector &selector,
                                   const PatchOptions &options) {
  return run_patch(document, selector, options, false);
}

common::Result<PatchOutcome> patch_all(const Json::Value &document,
                                       const document::MessageSelector &selector,
                                       const PatchOptions &options) {
  return run_patch(document, selector, options, true);
}

} // namespace scrubline::patch

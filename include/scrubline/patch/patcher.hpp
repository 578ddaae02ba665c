#pragma once

#include "scrubline/analysis/analyzer.hpp"
#include "scrubline/common/result.hpp"
#include "scrubline/document/locator.hpp"
#include "scrubline/document/message.hpp"
#include "scrubline/sanitize/sanitizer.hpp"

#include <json/json.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace scrubline::patch {

enum class PatchStatus {
  Patched,
  Unchanged,
  NoMessagesFound,
  NoMatchingMessage,
};

[[nodiscard]] std::string_view patch_status_name(PatchStatus status);

struct PatchOptions {
  document::LocatorOptions locator;
  sanitize::SanitizeOptions sanitizer;
};

/// What happened to one selected message.
struct MessagePatch {
  std::size_t index = 0;
  document::Role role = document::Role::Unknown;
  // "string" or "parts"; empty when the content had no text to sanitize.
  std::string content_shape;
  analysis::HazardReport hazards;
  std::vector<sanitize::TraceEntry> trace;
  std::size_t passes = 0;
  bool converged = true;
  std::size_t length_before = 0;
  std::size_t length_after = 0;
  std::string sha256_before;
  std::string sha256_after;

  [[nodiscard]] bool changed() const { return !trace.empty(); }
  [[nodiscard]] std::size_t bytes_removed() const {
    return length_before > length_after ? length_before - length_after : 0;
  }
};

struct PatchReport {
  PatchStatus status = PatchStatus::Unchanged;
  std::size_t message_count = 0;
  std::string messages_path;
  std::string selector;
  std::vector<MessagePatch> messages;
  std::vector<std::string> notes;

  [[nodiscard]] std::size_t bytes_removed() const;
};

struct PatchOutcome {
  Json::Value document;
  PatchReport report;
};

/// Sanitizes the last message matching `selector` in a copy of `document`.
/// Recoverable misses (no messages list, no matching message) succeed with
/// the document unchanged; a failing rule fails the call.
[[nodiscard]] common::Result<PatchOutcome>
patch(const Json::Value &document,
      const document::MessageSelector &selector = document::select_role(document::Role::Tool),
      const PatchOptions &options = {});

/// Like patch() but sanitizes every matching message.
[[nodiscard]] common::Result<PatchOutcome>
patch_all(const Json::Value &document,
          const document::MessageSelector &selector = document::select_role(document::Role::Tool),
          const PatchOptions &options = {});

} // namespace scrubline::patch

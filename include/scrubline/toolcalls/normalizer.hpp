#pragma once

#include "scrubline/common/result.hpp"
#include "scrubline/document/locator.hpp"

#include <json/json.h>

#include <cstddef>
#include <string>
#include <vector>

namespace scrubline::toolcalls {

struct ToolCallNote {
  std::size_t index = 0;
  // ArgumentsParseFailure or FormatError for problems, None for repairs.
  common::ErrorKind kind = common::ErrorKind::None;
  std::string detail;
};

struct ToolCallNormalization {
  Json::Value tool_calls;
  std::vector<ToolCallNote> notes;
  bool changed = false;
};

/// Lowercases each `function.name`, parses `function.arguments` (a JSON
/// string or an inline object) into an object, drops its `description` key
/// and stores it back as a compact JSON string. Unparseable arguments become
/// `{}`. Nothing outside `function` is touched.
[[nodiscard]] ToolCallNormalization normalize_tool_calls(const Json::Value &tool_calls);

/// FormatError describing the first element that is not in canonical form.
[[nodiscard]] common::Status validate_tool_calls(const Json::Value &tool_calls);

struct DocumentToolCallReport {
  std::size_t messages_changed = 0;
  std::size_t calls_seen = 0;
  // Notes for every assistant message, prefixed with its message index.
  std::vector<std::string> notes;
};

/// Normalizes the `tool_calls` of every assistant message in place. Fails
/// with NoMessagesFound when the document has no messages list.
[[nodiscard]] common::Result<DocumentToolCallReport>
normalize_document_tool_calls(Json::Value &document,
                              const document::LocatorOptions &options = {});

/// validate_tool_calls over every assistant message of the document.
[[nodiscard]] common::Status
validate_document_tool_calls(const Json::Value &document,
                             const document::LocatorOptions &options = {});

} // namespace scrubline::toolcalls

#include "scrubline/toolcalls/normalizer.hpp"

#include "scrubline/common/fs.hpp"
#include "scrubline/common/json_util.hpp"
#include "scrubline/document/message.hpp"
#include "scrubline/observability/global.hpp"

#include <optional>

namespace scrubline::toolcalls {

namespace {

constexpr const char *kReservedArgument = "description";

std::string element_label(const std::size_t index) {
  return "tool_calls[" + std::to_string(index) + "]";
}

bool has_string(const Json::Value &object, const char *key) {
  return object.isObject() && object.isMember(key) && object[key].isString();
}

Json::Value arguments_object(const Json::Value &function, const std::size_t index,
                             std::vector<ToolCallNote> &notes) {
  const auto fail = [&](const std::string &detail) {
    notes.push_back(ToolCallNote{
        .index = index, .kind = common::ErrorKind::ArgumentsParseFailure, .detail = detail});
    return Json::Value(Json::objectValue);
  };

  if (!function.isMember("arguments")) {
    return fail("arguments missing, replaced with {}");
  }
  const Json::Value &raw = function["arguments"];
  if (raw.isObject()) {
    return raw;
  }
  if (!raw.isString()) {
    return fail(std::string("arguments of type ") + common::json_type_name(raw) +
                ", replaced with {}");
  }
  if (common::trim(raw.asString()).empty()) {
    return fail("arguments empty, replaced with {}");
  }

  auto parsed = common::json_parse(raw.asString());
  if (!parsed.ok()) {
    return fail("arguments are not valid JSON (" + parsed.error() + "), replaced with {}");
  }
  if (!parsed.value().isObject()) {
    return fail(std::string("arguments are a JSON ") + common::json_type_name(parsed.value()) +
                ", replaced with {}");
  }
  return parsed.value();
}

Json::Value normalize_call(const Json::Value &call, const std::size_t index,
                           std::vector<ToolCallNote> &notes) {
  if (!call.isObject()) {
    notes.push_back(ToolCallNote{
        .index = index, .kind = common::ErrorKind::FormatError, .detail = "not an object"});
    return call;
  }
  if (!call.isMember("function") || !call["function"].isObject()) {
    notes.push_back(ToolCallNote{.index = index,
                                 .kind = common::ErrorKind::FormatError,
                                 .detail = "function object missing"});
    return call;
  }

  Json::Value out = call;
  Json::Value &function = out["function"];

  if (has_string(function, "name")) {
    const std::string name = function["name"].asString();
    const std::string lowered = common::to_lower(name);
    if (lowered != name) {
      common::json_assign(function["name"], Json::Value(lowered));
      notes.push_back(ToolCallNote{.index = index,
                                   .kind = common::ErrorKind::None,
                                   .detail = "function name " + name + " lowercased"});
    }
  }

  Json::Value arguments = arguments_object(function, index, notes);
  if (arguments.isMember(kReservedArgument)) {
    arguments.removeMember(kReservedArgument);
    notes.push_back(ToolCallNote{.index = index,
                                 .kind = common::ErrorKind::None,
                                 .detail = "description removed from arguments"});
  }
  common::json_assign(function["arguments"], Json::Value(common::json_write_compact(arguments)));
  return out;
}

// Description of the first non-canonical element, or nullopt.
std::optional<std::string> first_problem(const Json::Value &tool_calls) {
  if (!tool_calls.isArray()) {
    return "tool_calls must be an array";
  }
  for (Json::ArrayIndex i = 0; i < tool_calls.size(); ++i) {
    const Json::Value &call = tool_calls[i];
    const std::string label = element_label(i);
    if (!call.isObject()) {
      return label + " must be an object";
    }
    if (!has_string(call, "id") || call["id"].asString().empty()) {
      return label + ".id is missing";
    }
    if (!has_string(call, "type")) {
      return label + ".type is missing";
    }
    if (!call.isMember("function") || !call["function"].isObject()) {
      return label + ".function is missing";
    }
    const Json::Value &function = call["function"];
    if (!has_string(function, "name")) {
      return label + ".function.name is missing";
    }
    const std::string name = function["name"].asString();
    if (common::to_lower(name) != name) {
      return label + ".function.name must be lowercase";
    }
    if (!has_string(function, "arguments")) {
      return label + ".function.arguments must be a JSON string";
    }
    const auto parsed = common::json_parse(function["arguments"].asString());
    if (!parsed.ok() || !parsed.value().isObject()) {
      return label + ".function.arguments does not parse as an object";
    }
    if (parsed.value().isMember(kReservedArgument)) {
      return label + ".function.arguments must not contain description";
    }
  }
  return std::nullopt;
}

} // namespace

ToolCallNormalization normalize_tool_calls(const Json::Value &tool_calls) {
  ToolCallNormalization result;
  if (!tool_calls.isArray()) {
    result.tool_calls = tool_calls;
    result.notes.push_back(ToolCallNote{.index = 0,
                                        .kind = common::ErrorKind::FormatError,
                                        .detail = "tool_calls is not an array"});
    return result;
  }

  result.tool_calls = Json::Value(Json::arrayValue);
  for (Json::ArrayIndex i = 0; i < tool_calls.size(); ++i) {
    result.tool_calls.append(normalize_call(tool_calls[i], i, result.notes));
  }
  result.changed = result.tool_calls != tool_calls;
  return result;
}

common::Status validate_tool_calls(const Json::Value &tool_calls) {
  if (const auto problem = first_problem(tool_calls)) {
    return common::Status::error(common::ErrorKind::FormatError, *problem);
  }
  return common::Status::success();
}

common::Result<DocumentToolCallReport>
normalize_document_tool_calls(Json::Value &document, const document::LocatorOptions &options) {
  const auto located = document::locate_messages(document, options);
  Json::Value *messages =
      located.has_value() ? document::resolve_path(document, located->path) : nullptr;
  if (messages == nullptr) {
    return common::Result<DocumentToolCallReport>::failure(
        common::ErrorKind::NoMessagesFound,
        "no '" + options.messages_key + "' list of objects found");
  }

  DocumentToolCallReport report;
  for (Json::ArrayIndex i = 0; i < messages->size(); ++i) {
    Json::Value &message = (*messages)[i];
    if (document::message_role(message) != document::Role::Assistant ||
        !message.isMember("tool_calls")) {
      continue;
    }

    auto normalized = normalize_tool_calls(message["tool_calls"]);
    report.calls_seen += message["tool_calls"].isArray() ? message["tool_calls"].size() : 0;
    for (const auto &note : normalized.notes) {
      std::string line = "message " + std::to_string(i) + " " + element_label(note.index) + ": ";
      if (note.kind != common::ErrorKind::None) {
        line += std::string(common::error_kind_name(note.kind)) + ": ";
      }
      line += note.detail;
      report.notes.push_back(line);
      observability::record_tool_call_repaired(i, note.index, note.detail);
    }
    if (normalized.changed) {
      common::json_assign(message["tool_calls"], std::move(normalized.tool_calls));
      ++report.messages_changed;
    }
  }
  return common::Result<DocumentToolCallReport>::success(std::move(report));
}

common::Status validate_document_tool_calls(const Json::Value &document,
                                            const document::LocatorOptions &options) {
  const auto located = document::locate_messages(document, options);
  if (!located.has_value()) {
    return common::Status::error(common::ErrorKind::NoMessagesFound,
                                 "no '" + options.messages_key + "' list of objects found");
  }
  const Json::Value &messages = *located->messages;
  for (Json::ArrayIndex i = 0; i < messages.size(); ++i) {
    const Json::Value &message = messages[i];
    if (document::message_role(message) != document::Role::Assistant ||
        !message.isMember("tool_calls")) {
      continue;
    }
    if (const auto problem = first_problem(message["tool_calls"])) {
      return common::Status::error(common::ErrorKind::FormatError,
                                   "message " + std::to_string(i) + " " + *problem);
    }
  }
  return common::Status::success();
}

} // namespace scrubline::toolcalls

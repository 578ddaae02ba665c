#include "scrubline/document/message.hpp"

#include "scrubline/common/fs.hpp"
#include "scrubline/common/json_util.hpp"

namespace scrubline::document {

std::string_view role_name(const Role role) {
  switch (role) {
  case Role::System:
    return "system";
  case Role::User:
    return "user";
  case Role::Assistant:
    return "assistant";
  case Role::Tool:
    return "tool";
  case Role::Unknown:
    break;
  }
  return "unknown";
}

Role parse_role(const std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(std::string(value)));
  if (normalized == "system") {
    return Role::System;
  }
  if (normalized == "user") {
    return Role::User;
  }
  if (normalized == "assistant") {
    return Role::Assistant;
  }
  if (normalized == "tool") {
    return Role::Tool;
  }
  return Role::Unknown;
}

Role message_role(const Json::Value &message) {
  return parse_role(common::json_get_string(message, "role", ""));
}

std::optional<std::string> message_text(const Json::Value &message) {
  if (!message.isObject() || !message.isMember("content")) {
    return std::nullopt;
  }
  const Json::Value &content = message["content"];
  if (content.isString()) {
    return content.asString();
  }
  if (!content.isArray()) {
    return std::nullopt;
  }

  std::optional<std::string> joined;
  for (const auto &part : content) {
    if (!part.isObject() || !part["text"].isString()) {
      continue;
    }
    if (joined.has_value()) {
      joined->push_back('\n');
      joined->append(part["text"].asString());
    } else {
      joined = part["text"].asString();
    }
  }
  return joined;
}

MessageSelector select_role(const Role role) {
  return MessageSelector{
      .description = "role=" + std::string(role_name(role)),
      .matches = [role](const Json::Value &message,
                        std::size_t) { return message_role(message) == role; },
  };
}

MessageSelector select_index(const std::size_t index) {
  return MessageSelector{
      .description = "index=" + std::to_string(index),
      .matches = [index](const Json::Value &, const std::size_t candidate) {
        return candidate == index;
      },
  };
}

} // namespace scrubline::document

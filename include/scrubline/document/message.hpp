#pragma once

#include <json/json.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace scrubline::document {

enum class Role {
  System,
  User,
  Assistant,
  Tool,
  Unknown,
};

[[nodiscard]] std::string_view role_name(Role role);

/// Case-insensitive; anything outside the four known roles is Unknown.
[[nodiscard]] Role parse_role(std::string_view value);

/// Role of a message object; Unknown when `role` is absent or not a string.
[[nodiscard]] Role message_role(const Json::Value &message);

/// Text carried by `content`: a string, or the `text` members of an array of
/// content parts joined by newlines. nullopt for any other shape.
[[nodiscard]] std::optional<std::string> message_text(const Json::Value &message);

struct MessageSelector {
  std::string description;
  std::function<bool(const Json::Value &message, std::size_t index)> matches;
};

[[nodiscard]] MessageSelector select_role(Role role);
[[nodiscard]] MessageSelector select_index(std::size_t index);

} // namespace scrubline::document

#pragma once

#include "scrubline/common/result.hpp"

#include <json/json.h>

#include <string>
#include <vector>

namespace scrubline::common {

/// Parse any JSON text. Trailing garbage after the root value is an error.
[[nodiscard]] Result<Json::Value> json_parse(const std::string &text);

/// Parse a request document: the root must be an object or an array.
/// Failures carry ErrorKind::DocumentMalformed.
[[nodiscard]] Result<Json::Value> json_parse_document(const std::string &text);

/// Serialize with `indent` spaces per level (0 = single line). UTF-8 text is
/// emitted as-is rather than as \uXXXX escapes. Object members keep the order
/// they had in the parsed text; members added afterwards follow in name order.
/// Floating-point numbers use the shortest form that reads back to the same
/// value.
[[nodiscard]] std::string json_write(const Json::Value &value, int indent = 2);

/// Single-line serialization without any insignificant whitespace.
[[nodiscard]] std::string json_write_compact(const Json::Value &value);

/// Member names of an object in source order, then added members by name.
/// Empty for anything but an object.
[[nodiscard]] std::vector<std::string> json_member_names(const Json::Value &object);

/// Replace `slot` with `value` while keeping the slot's place among its
/// siblings when the document is written.
void json_assign(Json::Value &slot, Json::Value value);

/// String member of an object, or `fallback` when absent or not a string.
[[nodiscard]] std::string json_get_string(const Json::Value &object, const char *key,
                                          const std::string &fallback = "");

[[nodiscard]] const char *json_type_name(const Json::Value &value);

} // namespace scrubline::common

#include "scrubline/common/json_util.hpp"

#include "scrubline/common/fs.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace scrubline::common {

namespace {

Json::CharReaderBuilder reader_builder() {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["failIfExtra"] = true;
  builder["rejectDupKeys"] = false;
  return builder;
}

// Offset of a value in the text it was parsed from. Values built in code
// have no extent and sort after every parsed sibling.
std::ptrdiff_t source_position(const Json::Value &value) {
  if (value.getOffsetLimit() <= 0) {
    return std::numeric_limits<std::ptrdiff_t>::max();
  }
  return value.getOffsetStart();
}

// jsoncpp stores object members in a std::map, so its own writers emit them
// sorted by name. This writer walks members in source order and lets jsoncpp
// render only the scalars.
class OrderedWriter {
public:
  explicit OrderedWriter(const int indent)
      : indent_(indent > 0 ? static_cast<std::size_t>(indent) : 0) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    scalar_writer_.reset(builder.newStreamWriter());
  }

  std::string write(const Json::Value &value) {
    write_value(value, 0);
    return std::move(out_);
  }

private:
  void write_value(const Json::Value &value, const std::size_t depth) {
    switch (value.type()) {
    case Json::objectValue:
      write_object(value, depth);
      return;
    case Json::arrayValue:
      write_array(value, depth);
      return;
    case Json::realValue:
      write_real(value);
      return;
    default:
      write_scalar(value);
      return;
    }
  }

  void write_object(const Json::Value &object, const std::size_t depth) {
    const auto names = json_member_names(object);
    if (names.empty()) {
      out_ += "{}";
      return;
    }
    out_ += '{';
    for (std::size_t i = 0; i < names.size(); ++i) {
      if (i > 0) {
        out_ += ',';
      }
      break_line(depth + 1);
      write_scalar(Json::Value(names[i]));
      out_ += indent_ > 0 ? ": " : ":";
      write_value(object[names[i]], depth + 1);
    }
    break_line(depth);
    out_ += '}';
  }

  void write_array(const Json::Value &array, const std::size_t depth) {
    if (array.empty()) {
      out_ += "[]";
      return;
    }
    out_ += '[';
    for (Json::ArrayIndex i = 0; i < array.size(); ++i) {
      if (i > 0) {
        out_ += ',';
      }
      break_line(depth + 1);
      write_value(array[i], depth + 1);
    }
    break_line(depth);
    out_ += ']';
  }

  // Shortest round-trip form, so 0.7 stays 0.7 instead of 0.69999999999999996.
  void write_real(const Json::Value &value) {
    const double number = value.asDouble();
    std::array<char, 32> buffer{};
    const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), number);
    if (!std::isfinite(number) || ec != std::errc()) {
      write_scalar(value);
      return;
    }
    std::string text(buffer.data(), end);
    if (text.find_first_of(".eE") == std::string::npos) {
      text += ".0";
    }
    out_ += text;
  }

  void write_scalar(const Json::Value &value) {
    std::ostringstream stream;
    scalar_writer_->write(value, &stream);
    out_ += stream.str();
  }

  void break_line(const std::size_t depth) {
    if (indent_ == 0) {
      return;
    }
    out_ += '\n';
    out_.append(depth * indent_, ' ');
  }

  std::size_t indent_;
  std::unique_ptr<Json::StreamWriter> scalar_writer_;
  std::string out_;
};

} // namespace

Result<Json::Value> json_parse(const std::string &text) {
  const auto builder = reader_builder();
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errors;
  const char *begin = text.data();
  const char *end = begin + text.size();
  if (!reader->parse(begin, end, &root, &errors)) {
    return Result<Json::Value>::failure(trim(errors));
  }
  return Result<Json::Value>::success(std::move(root));
}

Result<Json::Value> json_parse_document(const std::string &text) {
  auto parsed = json_parse(text);
  if (!parsed.ok()) {
    return Result<Json::Value>::failure(ErrorKind::DocumentMalformed,
                                        "invalid JSON: " + parsed.error());
  }
  const auto &root = parsed.value();
  if (!root.isObject() && !root.isArray()) {
    return Result<Json::Value>::failure(ErrorKind::DocumentMalformed,
                                        std::string("root must be an object or array, got ") +
                                            json_type_name(root));
  }
  return parsed;
}

std::string json_write(const Json::Value &value, const int indent) {
  return OrderedWriter(indent).write(value);
}

std::string json_write_compact(const Json::Value &value) { return OrderedWriter(0).write(value); }

std::vector<std::string> json_member_names(const Json::Value &object) {
  if (!object.isObject()) {
    return {};
  }
  // getMemberNames() is sorted by name; the stable sort keeps that order for
  // members without a source position.
  std::vector<std::pair<std::ptrdiff_t, std::string>> members;
  for (auto &name : object.getMemberNames()) {
    members.emplace_back(source_position(object[name]), std::move(name));
  }
  std::stable_sort(members.begin(), members.end(),
                   [](const auto &a, const auto &b) { return a.first < b.first; });

  std::vector<std::string> names;
  names.reserve(members.size());
  for (auto &member : members) {
    names.push_back(std::move(member.second));
  }
  return names;
}

void json_assign(Json::Value &slot, Json::Value value) {
  const auto start = slot.getOffsetStart();
  const auto limit = slot.getOffsetLimit();
  slot = std::move(value);
  slot.setOffsetStart(start);
  slot.setOffsetLimit(limit);
}

std::string json_get_string(const Json::Value &object, const char *key,
                            const std::string &fallback) {
  if (!object.isObject()) {
    return fallback;
  }
  const Json::Value *member = object.find(key, key + std::char_traits<char>::length(key));
  if (member == nullptr || !member->isString()) {
    return fallback;
  }
  return member->asString();
}

const char *json_type_name(const Json::Value &value) {
  switch (value.type()) {
  case Json::nullValue:
    return "null";
  case Json::intValue:
  case Json::uintValue:
  case Json::realValue:
    return "number";
  case Json::stringValue:
    return "string";
  case Json::booleanValue:
    return "boolean";
  case Json::arrayValue:
    return "array";
  case Json::objectValue:
    return "object";
  }
  return "unknown";
}

} // namespace scrubline::common

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace scrubline::common {

/// Failure classes surfaced by the pipeline. `None` marks a plain message
/// without a taxonomy entry (I/O, configuration).
enum class ErrorKind {
  None,
  DocumentMalformed,
  NoMessagesFound,
  NoMatchingMessage,
  ArgumentsParseFailure,
  RuleApplicationError,
  FormatError,
};

[[nodiscard]] std::string_view error_kind_name(ErrorKind kind);

namespace detail {

inline std::string format_error(ErrorKind kind, std::string detail) {
  if (kind == ErrorKind::None) {
    return detail;
  }
  std::string out(error_kind_name(kind));
  out += ": ";
  out += detail;
  return out;
}

} // namespace detail

class Status {
public:
  static Status success() { return Status(true, ErrorKind::None, ""); }
  static Status error(std::string message) {
    return Status(false, ErrorKind::None, std::move(message));
  }
  static Status error(ErrorKind kind, std::string detail) {
    return Status(false, kind, detail::format_error(kind, std::move(detail)));
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  template <typename T> friend class Result;

  Status(bool ok, ErrorKind kind, std::string error)
      : ok_(ok), kind_(kind), error_(std::move(error)) {}

  bool ok_;
  ErrorKind kind_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(std::move(value), ErrorKind::None, ""); }
  static Result failure(std::string message) {
    return Result(std::nullopt, ErrorKind::None, std::move(message));
  }
  static Result failure(ErrorKind kind, std::string detail) {
    return Result(std::nullopt, kind, detail::format_error(kind, std::move(detail)));
  }
  static Result failure(const Status &status) {
    return Result(std::nullopt, status.kind(), status.error());
  }

  [[nodiscard]] bool ok() const { return value_.has_value(); }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

  [[nodiscard]] const T &value() const {
    if (!value_.has_value()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!value_.has_value()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }

  [[nodiscard]] Status status() const {
    return ok() ? Status::success() : Status(false, kind_, error_);
  }

private:
  Result(std::optional<T> value, ErrorKind kind, std::string error)
      : value_(std::move(value)), kind_(kind), error_(std::move(error)) {}

  std::optional<T> value_;
  ErrorKind kind_;
  std::string error_;
};

} // namespace scrubline::common

#include "scrubline/common/result.hpp"

namespace scrubline::common {

std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "Error";
  case ErrorKind::DocumentMalformed:
    return "DocumentMalformed";
  case ErrorKind::NoMessagesFound:
    return "NoMessagesFound";
  case ErrorKind::NoMatchingMessage:
    return "NoMatchingMessage";
  case ErrorKind::ArgumentsParseFailure:
    return "ArgumentsParseFailure";
  case ErrorKind::RuleApplicationError:
    return "RuleApplicationError";
  case ErrorKind::FormatError:
    return "FormatError";
  }
  return "Error";
}

} // namespace scrubline::common

#include "scrubline/text/markdown_scan.hpp"

#include <algorithm>

namespace scrubline::text {

std::size_t LinkScanner::label_close(const std::size_t open, const bool allow_empty) const {
  if (open >= text_.size() || text_[open] != '[') {
    return npos;
  }
  std::size_t i = open + 1;
  while (i < text_.size() && text_[i] != '[' && text_[i] != ']' && !is_line_break(text_[i])) {
    ++i;
  }
  if (i >= text_.size() || text_[i] != ']') {
    return npos;
  }
  if (!allow_empty && i == open + 1) {
    return npos;
  }
  return i;
}

std::size_t LinkScanner::target_close(const std::size_t open, std::size_t &stop) {
  if (unclosed_begin_ != npos && open >= unclosed_begin_ && open < unclosed_stop_) {
    stop = unclosed_stop_;
    return npos;
  }

  std::size_t i = open + 1;
  while (i < text_.size() && text_[i] != ')' && !is_line_break(text_[i])) {
    ++i;
  }
  if (i < text_.size() && text_[i] == ')') {
    return i;
  }

  unclosed_begin_ = open;
  unclosed_stop_ = i;
  stop = i;
  return npos;
}

std::optional<SpanMatch> LinkScanner::link_at(const std::size_t pos) {
  const std::size_t close = label_close(pos, false);
  if (close == npos || close + 1 >= text_.size() || text_[close + 1] != '(') {
    return std::nullopt;
  }
  std::size_t stop = 0;
  const std::size_t end = target_close(close + 1, stop);
  if (end == npos || end == close + 2) {
    return std::nullopt;
  }
  return SpanMatch{.begin = pos,
                   .end = end + 1,
                   .label = text_.substr(pos + 1, close - pos - 1),
                   .target = text_.substr(close + 2, end - close - 2)};
}

std::optional<SpanMatch> LinkScanner::image_at(const std::size_t pos) {
  if (pos + 1 >= text_.size() || text_[pos] != '!' || text_[pos + 1] != '[') {
    return std::nullopt;
  }
  const std::size_t close = label_close(pos + 1, true);
  if (close == npos || close + 1 >= text_.size() || text_[close + 1] != '(') {
    return std::nullopt;
  }
  std::size_t stop = 0;
  const std::size_t end = target_close(close + 1, stop);
  if (end == npos || end == close + 2) {
    return std::nullopt;
  }
  return SpanMatch{.begin = pos,
                   .end = end + 1,
                   .label = text_.substr(pos + 2, close - pos - 2),
                   .target = text_.substr(close + 2, end - close - 2)};
}

std::optional<SpanMatch> LinkScanner::nested_image_at(const std::size_t pos) {
  if (pos >= text_.size() || text_[pos] != '[') {
    return std::nullopt;
  }
  const auto inner = image_at(pos + 1);
  if (!inner.has_value()) {
    return std::nullopt;
  }
  const std::size_t close = inner->end;
  if (close + 1 >= text_.size() || text_[close] != ']' || text_[close + 1] != '(') {
    return std::nullopt;
  }
  std::size_t stop = 0;
  const std::size_t end = target_close(close + 1, stop);
  if (end == npos || end == close + 2) {
    return std::nullopt;
  }
  return SpanMatch{.begin = pos,
                   .end = end + 1,
                   .label = inner->label,
                   .target = text_.substr(close + 2, end - close - 2)};
}

std::optional<std::size_t> LinkScanner::unclosed_link_at(const std::size_t pos) {
  const std::size_t close = label_close(pos, false);
  if (close == npos || close + 1 >= text_.size() || text_[close + 1] != '(') {
    return std::nullopt;
  }
  std::size_t stop = 0;
  if (target_close(close + 1, stop) != npos) {
    return std::nullopt;
  }
  return stop;
}

std::optional<SpanMatch> bold_at(const std::string_view text, const std::size_t pos) {
  if (pos + 1 >= text.size() || text[pos] != '*' || text[pos + 1] != '*') {
    return std::nullopt;
  }
  std::size_t i = pos + 2;
  while (i < text.size() && text[i] != '*') {
    ++i;
  }
  if (i == pos + 2 || i + 1 >= text.size() || text[i + 1] != '*') {
    return std::nullopt;
  }
  return SpanMatch{.begin = pos, .end = i + 2, .label = text.substr(pos + 2, i - pos - 2)};
}

std::optional<SpanMatch> code_at(const std::string_view text, const std::size_t pos) {
  if (pos >= text.size() || text[pos] != '`') {
    return std::nullopt;
  }
  const std::size_t close = text.find('`', pos + 1);
  if (close == std::string_view::npos || close == pos + 1) {
    return std::nullopt;
  }
  return SpanMatch{.begin = pos, .end = close + 1, .label = text.substr(pos + 1, close - pos - 1)};
}

std::size_t heading_marker_length(const std::string_view text, const std::size_t line_start) {
  std::size_t i = line_start;
  while (i < text.size() && text[i] == '#') {
    ++i;
  }
  if (i == line_start) {
    return 0;
  }
  while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) {
    ++i;
  }
  return i - line_start;
}

std::size_t utf8_floor(const std::string_view text, std::size_t pos) {
  if (pos >= text.size()) {
    return text.size();
  }
  while (pos > 0 && (static_cast<unsigned char>(text[pos]) & 0xC0U) == 0x80U) {
    --pos;
  }
  return pos;
}

std::size_t count_lines(const std::string_view text) {
  if (text.empty()) {
    return 0;
  }
  return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n')) + 1;
}

} // namespace scrubline::text

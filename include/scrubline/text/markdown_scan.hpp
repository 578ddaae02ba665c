#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace scrubline::text {

/// A matched construct: `text[begin, end)` is the whole construct, `label`
/// and `target` view into the scanned text.
struct SpanMatch {
  std::size_t begin = 0;
  std::size_t end = 0;
  std::string_view label;
  std::string_view target;
};

/// Matches bracketed markdown constructs at a given position.
///
/// Labels stop at '[', ']' or a line break; targets stop at the first ')' or
/// a line break, so a construct never spans lines and an inner image never
/// consumes past its own ')'. A failed target scan is remembered so that the
/// other openers on the same stretch of line fail without rescanning, which
/// keeps a left-to-right sweep linear in the text length.
class LinkScanner {
public:
  explicit LinkScanner(std::string_view text) : text_(text) {}

  /// `[label](target)` at `pos`; label and target non-empty.
  [[nodiscard]] std::optional<SpanMatch> link_at(std::size_t pos);

  /// `![alt](target)` at `pos`; alt may be empty.
  [[nodiscard]] std::optional<SpanMatch> image_at(std::size_t pos);

  /// `[![alt](image)](target)` at `pos`; label is the alt text and target
  /// the outer target.
  [[nodiscard]] std::optional<SpanMatch> nested_image_at(std::size_t pos);

  /// `[label](` at `pos` whose target runs to the end of the line without a
  /// ')'. Returns the offset where the closing ')' belongs.
  [[nodiscard]] std::optional<std::size_t> unclosed_link_at(std::size_t pos);

private:
  static constexpr std::size_t npos = std::string_view::npos;

  [[nodiscard]] std::size_t label_close(std::size_t open, bool allow_empty) const;
  // Offset of the ')' closing the target opened at `open`, or npos. On
  // failure `stop` is the line break (or end of text) where scanning ended.
  [[nodiscard]] std::size_t target_close(std::size_t open, std::size_t &stop);

  std::string_view text_;
  std::size_t unclosed_begin_ = npos;
  std::size_t unclosed_stop_ = 0;
};

/// `**inner**` at `pos` with a non-empty inner run free of '*'.
[[nodiscard]] std::optional<SpanMatch> bold_at(std::string_view text, std::size_t pos);

/// `` `inner` `` at `pos` with a non-empty inner run free of backticks.
[[nodiscard]] std::optional<SpanMatch> code_at(std::string_view text, std::size_t pos);

/// Length of a heading marker (a run of '#' plus trailing spaces/tabs) at
/// `line_start`, or 0.
[[nodiscard]] std::size_t heading_marker_length(std::string_view text, std::size_t line_start);

[[nodiscard]] inline bool is_line_break(char ch) { return ch == '\n' || ch == '\r'; }

/// Space, tab, form feed and vertical tab.
[[nodiscard]] inline bool is_horizontal_space(char ch) {
  return ch == ' ' || ch == '\t' || ch == '\f' || ch == '\v';
}

/// Largest offset <= `pos` that does not split a UTF-8 sequence.
[[nodiscard]] std::size_t utf8_floor(std::string_view text, std::size_t pos);

/// Number of lines: 0 for empty text, otherwise newlines + 1.
[[nodiscard]] std::size_t count_lines(std::string_view text);

} // namespace scrubline::text

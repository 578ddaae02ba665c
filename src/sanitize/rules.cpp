#include "scrubline/sanitize/rules.hpp"

#include "scrubline/common/fs.hpp"
#include "scrubline/text/markdown_scan.hpp"

#include <algorithm>

namespace scrubline::sanitize {

namespace {

// Rewrites that can expose a new match of their own pattern run until the
// text stops changing. Every effective rewrite shortens the text.
template <typename Pass> std::string until_stable(const std::string &text, Pass pass) {
  std::string current = pass(text);
  if (current == text) {
    return current;
  }
  while (true) {
    std::string next = pass(current);
    if (next == current) {
      return next;
    }
    current = std::move(next);
  }
}

std::string unwrap_nested_images_once(const std::string &text) {
  text::LinkScanner scanner(text);
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '[') {
      if (const auto match = scanner.nested_image_at(i)) {
        out.push_back('[');
        out.append(match->label);
        out.append("](");
        out.append(match->target);
        out.push_back(')');
        i = match->end;
        continue;
      }
    }
    out.push_back(text[i]);
    ++i;
  }
  return out;
}

std::string strip_images_once(const std::string &text) {
  text::LinkScanner scanner(text);
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '!') {
      if (const auto match = scanner.image_at(i)) {
        out.append(match->label);
        i = match->end;
        continue;
      }
    }
    out.push_back(text[i]);
    ++i;
  }
  return out;
}

std::string strip_links_once(const std::string &text) {
  text::LinkScanner scanner(text);
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '[') {
      if (const auto match = scanner.link_at(i)) {
        out.append(match->label);
        i = match->end;
        continue;
      }
    }
    out.push_back(text[i]);
    ++i;
  }
  return out;
}

std::string strip_markup_once(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  bool line_start = true;
  std::size_t i = 0;
  while (i < text.size()) {
    if (line_start) {
      line_start = false;
      if (const std::size_t marker = text::heading_marker_length(text, i); marker > 0) {
        i += marker;
        continue;
      }
    }
    const char ch = text[i];
    if (ch == '*') {
      if (const auto match = text::bold_at(text, i)) {
        out.append(match->label);
        i = match->end;
        continue;
      }
    } else if (ch == '`') {
      if (const auto match = text::code_at(text, i)) {
        out.append(match->label);
        i = match->end;
        continue;
      }
    }
    out.push_back(ch);
    line_start = ch == '\n';
    ++i;
  }
  return out;
}

// Offset of the `n`-th newline (1-based), or npos.
std::size_t nth_newline(const std::string &text, std::size_t n) {
  std::size_t pos = std::string::npos;
  while (n > 0) {
    pos = text.find('\n', pos == std::string::npos ? 0 : pos + 1);
    if (pos == std::string::npos) {
      return pos;
    }
    --n;
  }
  return pos;
}

std::string cut_with_ellipsis(const std::string &text, const std::size_t max_length) {
  if (max_length < kEllipsis.size()) {
    return text.substr(0, text::utf8_floor(text, max_length));
  }
  std::string out = text.substr(0, text::utf8_floor(text, max_length - kEllipsis.size()));
  out.append(kEllipsis);
  return out;
}

// Keeps the `name:` header and the line after it, shortening that second
// line if needed. Empty when even a shortened header does not fit.
std::string keep_header(const std::string &text, const std::size_t max_length) {
  const std::size_t first_break = text.find('\n');
  const std::size_t second_break = text.find('\n', first_break + 1);
  const std::string first = text.substr(0, first_break);
  const std::string second =
      second_break == std::string::npos
          ? text.substr(first_break + 1)
          : text.substr(first_break + 1, second_break - first_break - 1);

  const std::size_t overhead = first.size() + 2 + kTruncationMarker.size();
  if (overhead + second.size() <= max_length) {
    std::string out = first;
    out.push_back('\n');
    out.append(second);
    out.push_back('\n');
    out.append(kTruncationMarker);
    return out;
  }
  if (overhead + kEllipsis.size() > max_length) {
    return "";
  }
  const std::size_t budget = max_length - overhead - kEllipsis.size();
  std::string out = first;
  out.push_back('\n');
  out.append(second.substr(0, text::utf8_floor(second, budget)));
  out.append(kEllipsis);
  out.push_back('\n');
  out.append(kTruncationMarker);
  return out;
}

const std::vector<std::string> kRuleNames = {
    "unwrap_nested_images", "close_incomplete_links", "canonicalize_path_separators",
    "decode_safe_percent",  "strip_images",           "strip_links",
    "strip_markup",         "collapse_whitespace",    "truncate_oversize",
};

} // namespace

std::string unwrap_nested_images(const std::string &text) {
  return until_stable(text, unwrap_nested_images_once);
}

std::string close_incomplete_links(const std::string &text) {
  text::LinkScanner scanner(text);
  std::vector<std::size_t> inserts;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '[') {
      continue;
    }
    if (const auto stop = scanner.unclosed_link_at(i)) {
      if (inserts.empty() || inserts.back() != *stop) {
        inserts.push_back(*stop);
      }
    }
  }
  if (inserts.empty()) {
    return text;
  }

  std::string out;
  out.reserve(text.size() + inserts.size());
  std::size_t copied = 0;
  for (const std::size_t at : inserts) {
    out.append(text, copied, at - copied);
    out.push_back(')');
    copied = at;
  }
  out.append(text, copied, std::string::npos);
  return out;
}

std::string canonicalize_path_separators(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '\\') {
      out.push_back(text[i]);
      ++i;
      continue;
    }
    std::size_t j = i;
    while (j < text.size() && text[j] == '\\') {
      ++j;
    }
    if (j - i >= 2) {
      out.push_back('/');
    } else {
      out.push_back('\\');
    }
    i = j;
  }
  return out;
}

std::string decode_safe_percent(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  std::size_t copied = 0;
  std::size_t pos = text.find("%2B");
  while (pos != std::string::npos) {
    out.append(text, copied, pos - copied);
    out.push_back('+');
    copied = pos + 3;
    pos = text.find("%2B", copied);
  }
  out.append(text, copied, std::string::npos);
  return out;
}

std::string strip_images(const std::string &text) { return until_stable(text, strip_images_once); }

std::string strip_links(const std::string &text) { return until_stable(text, strip_links_once); }

std::string strip_markup(const std::string &text) { return until_stable(text, strip_markup_once); }

std::string collapse_whitespace(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    const char ch = text[i];
    if (text::is_horizontal_space(ch)) {
      std::size_t j = i;
      while (j < text.size() && text::is_horizontal_space(text[j])) {
        ++j;
      }
      out.push_back(' ');
      i = j;
      continue;
    }
    if (ch == '\n') {
      std::size_t newlines = 0;
      std::size_t last = i;
      std::size_t j = i;
      while (j < text.size() &&
             (text[j] == '\n' || text[j] == '\r' || text::is_horizontal_space(text[j]))) {
        if (text[j] == '\n') {
          ++newlines;
          last = j;
        }
        ++j;
      }
      if (newlines >= 3) {
        out.append("\n\n");
        i = last + 1;
        continue;
      }
    }
    out.push_back(ch);
    ++i;
  }
  return out;
}

std::string truncate_oversize(const std::string &text, const RuleOptions &options) {
  std::string out = text;
  if (options.max_lines > 0 && text::count_lines(out) > options.max_lines) {
    const std::size_t keep = options.max_lines - 1;
    if (keep == 0) {
      out.assign(kTruncationMarker);
    } else {
      out.resize(nth_newline(out, keep));
      out.push_back('\n');
      out.append(kTruncationMarker);
    }
  }

  if (out.size() <= options.max_length) {
    return out;
  }
  if (common::starts_with(out, std::string(kHeaderPrefix)) && out.find('\n') != std::string::npos) {
    if (std::string kept = keep_header(out, options.max_length); !kept.empty()) {
      return kept;
    }
  }
  return cut_with_ellipsis(out, options.max_length);
}

std::vector<Rule> default_rules(const RuleOptions &options) {
  return {
      {"unwrap_nested_images", unwrap_nested_images},
      {"close_incomplete_links", close_incomplete_links},
      {"canonicalize_path_separators", canonicalize_path_separators},
      {"decode_safe_percent", decode_safe_percent},
      {"strip_images", strip_images},
      {"strip_links", strip_links},
      {"strip_markup", strip_markup},
      {"collapse_whitespace", collapse_whitespace},
      {"truncate_oversize",
       [options](const std::string &text) { return truncate_oversize(text, options); }},
  };
}

const std::vector<std::string> &rule_names() { return kRuleNames; }

bool is_rule_name(const std::string_view name) {
  return std::find(kRuleNames.begin(), kRuleNames.end(), name) != kRuleNames.end();
}

common::Status validate_rule_options(const RuleOptions &options) {
  if (options.max_length < 16) {
    return common::Status::error("max_length must be at least 16, got " +
                                 std::to_string(options.max_length));
  }
  if (options.max_lines == 1 || options.max_lines == 2) {
    return common::Status::error("max_lines must be 0 or at least 3, got " +
                                 std::to_string(options.max_lines));
  }
  return common::Status::success();
}

} // namespace scrubline::sanitize

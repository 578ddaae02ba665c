#include "scrubline/analysis/analyzer.hpp"

#include "scrubline/text/markdown_scan.hpp"

#include <algorithm>
#include <array>

namespace scrubline::analysis {

namespace {

struct VocabularyEntry {
  std::string_view label;
  std::string_view pattern;
};

constexpr std::array<VocabularyEntry, 35> kVocabulary = {{
    {"\\t", "\t"}, {"\\n", "\n"}, {"\\r", "\r"}, {"\\\\", "\\\\"}, {"%", "%"},
    {"&", "&"},    {"<", "<"},    {">", ">"},    {"\"", "\""},     {"'", "'"},
    {"[", "["},    {"]", "]"},    {"(", "("},    {")", ")"},       {"{", "{"},
    {"}", "}"},    {"!", "!"},    {"#", "#"},    {"*", "*"},       {"_", "_"},
    {"`", "`"},    {"|", "|"},    {"~", "~"},    {"^", "^"},       {"+", "+"},
    {"=", "="},    {"@", "@"},    {"$", "$"},    {";", ";"},       {":", ":"},
    {",", ","},    {".", "."},    {"?", "?"},    {"/", "/"},       {"\\", "\\"},
}};

std::size_t count_occurrences(const std::string_view text, const std::string_view pattern) {
  std::size_t count = 0;
  std::size_t pos = text.find(pattern);
  while (pos != std::string_view::npos) {
    ++count;
    pos = text.find(pattern, pos + pattern.size());
  }
  return count;
}

bool is_url_stop(const char ch) {
  switch (ch) {
  case ' ':
  case '\t':
  case '\n':
  case '\r':
  case '\f':
  case '\v':
  case '<':
  case '>':
  case '"':
  case '{':
  case '}':
  case '|':
  case '\\':
  case '^':
  case '`':
  case '[':
  case ']':
  case '(':
  case ')':
    return true;
  default:
    return false;
  }
}

std::vector<std::string> find_urls(const std::string_view text) {
  std::vector<std::string> urls;
  std::size_t pos = 0;
  while ((pos = text.find("http", pos)) != std::string_view::npos) {
    std::size_t body = pos + 4;
    if (body < text.size() && text[body] == 's') {
      ++body;
    }
    if (text.substr(body, 3) != "://") {
      pos += 4;
      continue;
    }
    std::size_t end = body + 3;
    while (end < text.size() && !is_url_stop(text[end])) {
      ++end;
    }
    if (end == body + 3) {
      pos = end;
      continue;
    }
    std::string url(text.substr(pos, end - pos));
    if (std::find(urls.begin(), urls.end(), url) == urls.end()) {
      urls.push_back(std::move(url));
    }
    pos = end;
  }
  return urls;
}

std::size_t utf8_sequence_length(const unsigned char lead) {
  if (lead >= 0xF0U) {
    return 4;
  }
  if (lead >= 0xE0U) {
    return 3;
  }
  if (lead >= 0xC0U) {
    return 2;
  }
  return 1;
}

std::set<std::string> find_escapes(const std::string_view text) {
  std::set<std::string> escapes;
  for (std::size_t i = 0; i + 1 < text.size(); ++i) {
    if (text[i] != '\\' || text[i + 1] == '\\' || (i > 0 && text[i - 1] == '\\')) {
      continue;
    }
    const std::size_t width = utf8_sequence_length(static_cast<unsigned char>(text[i + 1]));
    escapes.insert(std::string(text.substr(i, 1 + width)));
  }
  return escapes;
}

bool has_tab_header(const std::string_view text) {
  std::size_t i = 0;
  while (i < text.size() && text[i] != ':' && text[i] != '\t' && text[i] != ' ' &&
         !text::is_line_break(text[i])) {
    ++i;
  }
  return i > 0 && i + 1 < text.size() && text[i] == ':' && text[i + 1] == '\t';
}

// Mirrors the conditions under which whitespace collapsing rewrites text: a
// horizontal run longer than one character or containing anything but a
// space, or three or more newlines separated only by whitespace.
bool has_whitespace_runs(const std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const char ch = text[i];
    if (text::is_horizontal_space(ch)) {
      if (ch != ' ' || (i + 1 < text.size() && text::is_horizontal_space(text[i + 1]))) {
        return true;
      }
      ++i;
      continue;
    }
    if (ch == '\n') {
      std::size_t newlines = 0;
      std::size_t j = i;
      while (j < text.size() &&
             (text[j] == '\n' || text[j] == '\r' || text::is_horizontal_space(text[j]))) {
        if (text[j] == '\n' && ++newlines >= 3) {
          return true;
        }
        ++j;
      }
    }
    ++i;
  }
  return false;
}

bool has_markup(const std::string_view text) {
  bool line_start = true;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (line_start && text::heading_marker_length(text, i) > 0) {
      return true;
    }
    line_start = text[i] == '\n';
    if ((text[i] == '*' && text::bold_at(text, i).has_value()) ||
        (text[i] == '`' && text::code_at(text, i).has_value())) {
      return true;
    }
  }
  return false;
}

void scan_links(const std::string_view text, HazardReport &report) {
  text::LinkScanner scanner(text);
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '!') {
      if (const auto image = scanner.image_at(i)) {
        report.links.push_back(MarkdownLink{.label = std::string(image->label),
                                            .target = std::string(image->target),
                                            .image = true});
        ++i;
      }
      continue;
    }
    if (text[i] != '[') {
      continue;
    }
    if (!report.flags.nested_image && scanner.nested_image_at(i).has_value()) {
      report.flags.nested_image = true;
    }
    if (const auto link = scanner.link_at(i)) {
      report.links.push_back(MarkdownLink{.label = std::string(link->label),
                                          .target = std::string(link->target),
                                          .image = false});
    } else if (!report.flags.incomplete_link && scanner.unclosed_link_at(i).has_value()) {
      report.flags.incomplete_link = true;
    }
  }
}

void count_non_ascii(const std::string_view text, HazardReport &report) {
  for (std::size_t i = 0; i < text.size(); ++i) {
    const auto lead = static_cast<unsigned char>(text[i]);
    if (lead < 0x80U) {
      continue;
    }
    report.flags.non_ascii = true;
    if ((lead & 0xF0U) == 0xE0U && i + 2 < text.size()) {
      const auto b1 = static_cast<unsigned char>(text[i + 1]);
      const auto b2 = static_cast<unsigned char>(text[i + 2]);
      const unsigned int code = ((lead & 0x0FU) << 12U) | ((b1 & 0x3FU) << 6U) | (b2 & 0x3FU);
      if (code >= 0x4E00U && code <= 0x9FFFU) {
        ++report.cjk_count;
      }
      i += 2;
    }
  }
}

} // namespace

bool HazardReport::has_links() const {
  return std::any_of(links.begin(), links.end(), [](const MarkdownLink &l) { return !l.image; });
}

bool HazardReport::has_images() const {
  return std::any_of(links.begin(), links.end(), [](const MarkdownLink &l) { return l.image; });
}

bool HazardReport::has_hazards() const {
  return flags.tab_header || flags.nested_image || flags.doubled_backslash ||
         flags.encoded_plus || flags.too_many_lines || flags.incomplete_link || flags.markup ||
         flags.whitespace_runs || flags.oversized || !links.empty();
}

std::size_t HazardReport::count_of(const std::string_view label) const {
  for (const auto &[name, count] : char_counts) {
    if (name == label) {
      return count;
    }
  }
  return 0;
}

HazardReport analyze(const std::string_view text, const AnalyzerOptions &options) {
  HazardReport report;
  report.length = text.size();
  report.line_count = text::count_lines(text);

  for (const auto &entry : kVocabulary) {
    if (const std::size_t count = count_occurrences(text, entry.pattern); count > 0) {
      report.char_counts.emplace_back(std::string(entry.label), count);
    }
  }

  report.urls = find_urls(text);
  report.escapes = find_escapes(text);
  scan_links(text, report);
  count_non_ascii(text, report);

  report.flags.tab_header = has_tab_header(text);
  report.flags.doubled_backslash = text.find("\\\\") != std::string_view::npos;
  report.flags.encoded_plus = text.find("%2B") != std::string_view::npos;
  report.flags.too_many_lines = options.line_ceiling > 0 && report.line_count > options.line_ceiling;
  report.flags.markup = has_markup(text);
  report.flags.whitespace_runs = has_whitespace_runs(text);
  report.flags.oversized = options.max_length > 0 && report.length > options.max_length;
  return report;
}

std::vector<std::string> suggested_rules(const HazardReport &report) {
  const auto &f = report.flags;
  std::vector<std::string> rules;
  if (f.nested_image) {
    rules.emplace_back("unwrap_nested_images");
  }
  if (f.incomplete_link) {
    rules.emplace_back("close_incomplete_links");
  }
  if (f.doubled_backslash) {
    rules.emplace_back("canonicalize_path_separators");
  }
  if (f.encoded_plus) {
    rules.emplace_back("decode_safe_percent");
  }
  if (report.has_images()) {
    rules.emplace_back("strip_images");
  }
  if (report.has_links() || f.nested_image || f.incomplete_link) {
    rules.emplace_back("strip_links");
  }
  if (f.markup) {
    rules.emplace_back("strip_markup");
  }
  if (f.whitespace_runs || f.tab_header) {
    rules.emplace_back("collapse_whitespace");
  }
  if (f.oversized || f.too_many_lines) {
    rules.emplace_back("truncate_oversize");
  }
  return rules;
}

std::vector<std::string> describe_hazards(const HazardReport &report) {
  const auto &f = report.flags;
  std::vector<std::string> lines;
  if (f.tab_header) {
    lines.emplace_back("tab-separated key: value header line");
  }
  if (f.nested_image) {
    lines.emplace_back("image nested inside a link");
  }
  if (f.incomplete_link) {
    lines.emplace_back("link target without closing parenthesis");
  }
  if (f.doubled_backslash) {
    lines.emplace_back("doubled backslash sequence");
  }
  if (f.encoded_plus) {
    lines.emplace_back("percent-encoded plus sign (%2B)");
  }
  if (!report.links.empty()) {
    lines.emplace_back(std::to_string(report.links.size()) + " markdown link(s) or image(s)");
  }
  if (f.markup) {
    lines.emplace_back("emphasis, code or heading markup");
  }
  if (f.whitespace_runs) {
    lines.emplace_back("collapsible whitespace");
  }
  if (f.too_many_lines) {
    lines.emplace_back("line count " + std::to_string(report.line_count) + " above ceiling");
  }
  if (f.oversized) {
    lines.emplace_back("length " + std::to_string(report.length) + " above ceiling");
  }
  return lines;
}

} // namespace scrubline::analysis

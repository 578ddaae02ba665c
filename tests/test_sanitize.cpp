#include "test_framework.hpp"

#include "scrubline/sanitize/rules.hpp"
#include "scrubline/sanitize/sanitizer.hpp"

#include <stdexcept>
#include <string>

namespace {

scrubline::sanitize::SanitizeResult run_sanitize(const std::string &input,
                                                 const scrubline::sanitize::SanitizeOptions &options =
                                                     {}) {
  auto result = scrubline::sanitize::sanitize(input, options);
  scrubline::tests::require(result.ok(), result.error());
  return result.value();
}

bool ends_with(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

void register_sanitize_tests(std::vector<scrubline::tests::TestCase> &tests) {
  using scrubline::tests::require;
  using scrubline::tests::require_text;
  namespace sz = scrubline::sanitize;

  tests.push_back({"rule_names_are_in_canonical_order", [] {
                     const auto &names = sz::rule_names();
                     require(names.size() == 9, "nine rules");
                     require(names.front() == "unwrap_nested_images", "first rule");
                     require(names.back() == "truncate_oversize", "last rule");
                     const auto rules = sz::default_rules();
                     for (std::size_t i = 0; i < rules.size(); ++i) {
                       require(rules[i].name == names[i], "rule order mismatch at " + rules[i].name);
                     }
                   }});

  tests.push_back({"badge_link_reduces_to_alt_text", [] {
                     const auto result =
                         run_sanitize("[![Python](https://img.shields.io/badge/Python-3.12%2B-"
                                      "blue.svg)](https://www.python.org/)");
                     require_text(result.text, "Python", "result.text");
                     require(result.converged, "should converge");
                     const auto triggered = result.rules_triggered();
                     require(triggered.size() == 2, "two rules fired");
                     require(triggered[0] == "unwrap_nested_images" && triggered[1] == "strip_links",
                             "unwrap then strip");
                   }});

  tests.push_back({"doubled_backslashes_become_forward_slashes", [] {
                     const auto result = run_sanitize("C:\\\\Users\\\\name\\\\file.txt");
                     require_text(result.text, "C:/Users/name/file.txt", "result.text");
                     require(sz::canonicalize_path_separators("a\\nb") == "a\\nb",
                             "single backslash kept");
                   }});

  tests.push_back({"encoded_plus_is_decoded", [] {
                     const auto result = run_sanitize("requires Python 3.12%2B");
                     require_text(result.text, "requires Python 3.12+", "result.text");
                     require(sz::decode_safe_percent("50%25 off") == "50%25 off",
                             "other escapes untouched");
                   }});

  tests.push_back({"oversize_content_is_cut_with_ellipsis", [] {
                     sz::SanitizeOptions options;
                     options.rules.max_length = 500;
                     const auto result = run_sanitize(std::string(3000, 'a'), options);
                     require(result.text.size() <= 500, "length ceiling");
                     require(ends_with(result.text, "..."), "ellipsis suffix");
                     require(result.bytes_removed() == 2500, "bytes removed");
                   }});

  tests.push_back({"oversize_cut_respects_utf8_boundaries", [] {
                     std::string cjk;
                     for (int i = 0; i < 600; ++i) {
                       cjk += "\xe4\xb8\xad";
                     }
                     const auto out = sz::truncate_oversize(cjk, {.max_length = 100, .max_lines = 0});
                     require(out.size() <= 100, "length ceiling");
                     require(ends_with(out, "..."), "ellipsis suffix");
                     require((out.size() - 3) % 3 == 0, "no split code point");
                   }});

  tests.push_back({"name_header_survives_truncation", [] {
                     const std::string input = "name: read_file\n" + std::string(300, 'x');
                     const auto out = sz::truncate_oversize(input, {.max_length = 100, .max_lines = 0});
                     require(out.size() <= 100, "length ceiling");
                     require(out.rfind("name: read_file\n", 0) == 0, "header kept");
                     require(ends_with(out, "[content truncated]"), "marker appended");
                   }});

  tests.push_back({"line_ceiling_keeps_leading_lines", [] {
                     const std::string input = "l0\nl1\nl2\nl3\nl4\nl5";
                     const auto out =
                         sz::truncate_oversize(input, {.max_length = 10000, .max_lines = 4});
                     require_text(out, "l0\nl1\nl2\n[content truncated]", "out");
                     require(sz::truncate_oversize(out, {.max_length = 10000, .max_lines = 4}) ==
                                 out,
                             "already within the ceiling");
                   }});

  tests.push_back({"incomplete_link_is_closed_then_stripped", [] {
                     require(sz::close_incomplete_links("a [b](c\nnext") == "a [b](c)\nnext",
                             "paren inserted before the line break");
                     const auto result = run_sanitize("see [docs](https://x.io/page");
                     require_text(result.text, "see docs", "result.text");
                   }});

  tests.push_back({"markup_and_whitespace_are_flattened", [] {
                     require(sz::strip_markup("# Title\n**bold** and `code`") ==
                                 "Title\nbold and code",
                             "markup removed");
                     require(sz::collapse_whitespace("a\t\tb") == "a b", "horizontal run");
                     require(sz::collapse_whitespace("a\n\n\n\nb") == "a\n\nb", "blank lines");
                     require(sz::collapse_whitespace("a\n\nb") == "a\n\nb", "paragraph kept");
                   }});

  tests.push_back({"sanitize_is_idempotent", [] {
                     const std::string input =
                         "# Report\n\n\n\n**Status**:\tok [home](https://h.io) "
                         "![x](y.png) C:\\\\tmp\\\\a %2B `done`";
                     const auto first = run_sanitize(input);
                     const auto second = run_sanitize(first.text);
                     require(second.text == first.text, "second run changed the text");
                     require(!second.changed(), "second run recorded a trace");
                   }});

  tests.push_back({"clean_text_is_left_alone", [] {
                     const auto result = run_sanitize("Plain result: 42 files processed.");
                     require_text(result.text, "Plain result: 42 files processed.", "result.text");
                     require(!result.changed(), "no trace expected");
                     require(result.passes == 1 && result.converged, "one quiet pass");

                     const auto empty = run_sanitize("");
                     require(empty.passes == 0 && empty.converged, "empty input short-circuits");
                   }});

  tests.push_back({"disabled_rules_are_skipped", [] {
                     sz::SanitizeOptions options;
                     options.disabled_rules = {"strip_links"};
                     const auto result = run_sanitize("[docs](https://x.io)", options);
                     require_text(result.text, "[docs](https://x.io)", "result.text");
                     require(sz::enabled_rules(options).size() == 8, "eight rules left");
                   }});

  tests.push_back({"invalid_options_are_rejected", [] {
                     sz::SanitizeOptions short_length;
                     short_length.rules.max_length = 8;
                     require(!sz::validate_sanitize_options(short_length).ok(), "max_length < 16");

                     sz::SanitizeOptions two_lines;
                     two_lines.rules.max_lines = 2;
                     require(!sz::validate_sanitize_options(two_lines).ok(), "max_lines == 2");

                     sz::SanitizeOptions unknown;
                     unknown.disabled_rules = {"strip_everything"};
                     const auto result = sz::sanitize("text", unknown);
                     require(!result.ok(), "unknown rule should fail");
                     require(result.error().find("strip_everything") != std::string::npos,
                             result.error());
                   }});

  tests.push_back({"throwing_rule_fails_with_rule_application_error", [] {
                     std::vector<sz::Rule> rules = {
                         {"explode", [](const std::string &) -> std::string {
                            throw std::runtime_error("bad input");
                          }}};
                     const sz::Sanitizer sanitizer(std::move(rules));
                     const auto result = sanitizer.run("anything");
                     require(!result.ok(), "failure expected");
                     require(result.kind() == scrubline::common::ErrorKind::RuleApplicationError,
                             "error kind");
                     require(result.error().find("explode: bad input") != std::string::npos,
                             result.error());
                   }});

  tests.push_back({"non_shrinking_rules_stop_after_stalled_pass_budget", [] {
                     std::vector<sz::Rule> rules = {
                         {"grow", [](const std::string &text) { return text + "x"; }}};
                     const sz::Sanitizer sanitizer(std::move(rules), 3);
                     const auto result = sanitizer.run("a");
                     require(result.ok(), result.error());
                     require(!result.value().converged, "should not converge");
                     require(result.value().passes == 4, "first pass plus three stalled");
                     require_text(result.value().text, "axxxx", "result.value().text");
                   }});

  tests.push_back({"shrinking_rules_run_until_fixed_point", [] {
                     std::vector<sz::Rule> rules = {
                         {"drop_first", [](const std::string &text) {
                            return text.empty() ? text : text.substr(1);
                          }}};
                     const sz::Sanitizer sanitizer(std::move(rules), 1);
                     const auto result = sanitizer.run("abcdefghij");
                     require(result.ok(), result.error());
                     require(result.value().converged, "shrinking passes never stall");
                     require(result.value().passes == 11, "ten changing passes and a quiet one");
                     require_text(result.value().text, "", "result.value().text");
                   }});

  tests.push_back({"fixed_point_reached_on_last_changing_pass_counts_as_converged", [] {
                     // Four changing passes: each closes one link that the
                     // previous pass exposed.
                     const auto first = run_sanitize(")[x][(*]![(*]`(!`]``]x]*!x");
                     require_text(first.text, ")x", "first.text");
                     require(first.converged, "fixed point was reached");
                     require(first.passes == 5, "four changing passes and a quiet one");

                     const auto second = run_sanitize(first.text);
                     require_text(second.text, first.text, "second.text");
                     require(!second.changed(), "second run recorded a trace");
                   }});

  tests.push_back({"deeply_nested_links_converge_and_stay_stable", [] {
                     std::string input = "[x]";
                     for (int i = 0; i < 12; ++i) {
                       input += "[(*]";
                     }
                     input += "(*";
                     const auto first = run_sanitize(input);
                     require_text(first.text, "x", "first.text");
                     require(first.converged, "deep chain converged");
                     require(first.passes == 14, "one level per pass plus a quiet pass");

                     const auto second = run_sanitize(first.text);
                     require(!second.changed(), "second run recorded a trace");
                   }});
}

#include "test_framework.hpp"

#include "scrubline/common/digest.hpp"
#include "scrubline/common/fs.hpp"
#include "scrubline/common/json_util.hpp"
#include "scrubline/common/result.hpp"
#include "scrubline/common/toml.hpp"
#include "tests/helpers/test_helpers.hpp"

void register_common_tests(std::vector<scrubline::tests::TestCase> &tests) {
  using scrubline::tests::require;
  using scrubline::tests::require_text;
  namespace common = scrubline::common;

  tests.push_back({"status_error_kind_prefixes_message", [] {
                     const auto status =
                         common::Status::error(common::ErrorKind::NoMessagesFound, "none here");
                     require(!status.ok(), "status should fail");
                     require(status.kind() == common::ErrorKind::NoMessagesFound, "kind kept");
                     require_text(status.error(), "NoMessagesFound: none here", "status.error()");
                   }});

  tests.push_back({"result_failure_from_status_keeps_kind", [] {
                     const auto status =
                         common::Status::error(common::ErrorKind::RuleApplicationError, "boom");
                     const auto result = common::Result<int>::failure(status);
                     require(!result.ok(), "result should fail");
                     require(result.kind() == common::ErrorKind::RuleApplicationError,
                             "kind carried over");
                     require(result.status().error() == status.error(), "status round trip");
                   }});

  tests.push_back({"trim_and_lower_helpers", [] {
                     require(common::trim("  a b \t\n") == "a b", "trim");
                     require(common::to_lower("ReadFile") == "readfile", "to_lower");
                     require(common::starts_with("name: x", "name:"), "starts_with");
                   }});

  tests.push_back({"write_text_then_read_text", [] {
                     scrubline::testing::TempWorkspace workspace;
                     const auto path = (workspace.path() / "out.json").string();
                     auto written = common::write_text(path, "{\"a\": 1}\n");
                     require(written.ok(), written.error());
                     auto read = common::read_text(path);
                     require(read.ok(), read.error());
                     require(read.value() == "{\"a\": 1}\n", "content mismatch");
                   }});

  tests.push_back({"read_text_missing_file_fails", [] {
                     scrubline::testing::TempWorkspace workspace;
                     auto read = common::read_text((workspace.path() / "absent.json").string());
                     require(!read.ok(), "missing file should fail");
                   }});

  tests.push_back({"toml_sections_arrays_and_types", [] {
                     const std::string toml = "top = \"x\"\n"
                                              "[sanitizer]\n"
                                              "max_length = 500 # inline comment\n"
                                              "disabled_rules = [\n"
                                              "  \"strip_markup\",\n"
                                              "  \"collapse_whitespace\",\n"
                                              "]\n"
                                              "[selector]\n"
                                              "all = true\n";
                     auto parsed = common::parse_toml(toml);
                     require(parsed.ok(), parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.get_string("top") == "x", "top-level key");
                     require(doc.get_size("sanitizer.max_length", 0) == 500, "size value");
                     require(doc.get_bool("selector.all", false), "bool value");
                     const auto rules = doc.get_string_array("sanitizer.disabled_rules");
                     require(rules.size() == 2 && rules[1] == "collapse_whitespace",
                             "multi-line array");
                     require(doc.keys_in("selector").size() == 1, "keys_in");
                   }});

  tests.push_back({"json_parse_document_rejects_scalars_and_garbage", [] {
                     auto scalar = common::json_parse_document("42");
                     require(!scalar.ok(), "scalar root should fail");
                     require(scalar.kind() == common::ErrorKind::DocumentMalformed, "kind");

                     auto broken = common::json_parse_document("{\"a\": ");
                     require(!broken.ok(), "truncated JSON should fail");

                     auto trailing = common::json_parse_document("{} {}");
                     require(!trailing.ok(), "trailing data should fail");

                     auto ok = common::json_parse_document("[{\"a\": 1}]");
                     require(ok.ok(), ok.error());
                   }});

  tests.push_back({"json_write_compact_and_utf8", [] {
                     Json::Value value(Json::objectValue);
                     value["x"] = 1;
                     value["s"] = "\xe4\xb8\xad";
                     const std::string compact = common::json_write_compact(value);
                     require(compact == "{\"s\":\"\xe4\xb8\xad\",\"x\":1}", compact);
                     const std::string pretty = common::json_write(value, 2);
                     require(pretty.find("\n  \"x\": 1") != std::string::npos, pretty);
                   }});

  tests.push_back({"sha256_hex_known_vector", [] {
                     require(common::sha256_hex("abc") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "sha256(abc)");
                   }});

  tests.push_back({"json_write_keeps_source_member_order_and_short_doubles", [] {
                     const std::string text =
                         R"({"z":1,"a":{"y":true,"b":null},"t":0.7,"p":0.1,"n":[1,2.5,1.0]})";
                     auto parsed = common::json_parse(text);
                     require(parsed.ok(), parsed.error());
                     require_text(common::json_write_compact(parsed.value()), text, "round trip");

                     auto value = parsed.value();
                     common::json_assign(value["z"], Json::Value("replaced"));
                     value["m"] = 2;
                     value["c"] = 3;
                     require_text(common::json_write_compact(value),
                                  R"({"z":"replaced","a":{"y":true,"b":null},"t":0.7,"p":0.1,)"
                                  R"("n":[1,2.5,1.0],"c":3,"m":2})",
                                  "assigned member keeps its place, added members follow by name");

                     const std::vector<std::string> names = common::json_member_names(value["a"]);
                     require(names == std::vector<std::string>({"y", "b"}), "member names");
                     require(common::json_member_names(Json::Value(1)).empty(), "not an object");
                   }});

  tests.push_back({"json_write_pretty_prints_nested_containers", [] {
                     auto parsed = common::json_parse(R"({"b":[1,{}],"a":[]})");
                     require(parsed.ok(), parsed.error());
                     require_text(common::json_write(parsed.value(), 2),
                                  "{\n  \"b\": [\n    1,\n    {}\n  ],\n  \"a\": []\n}",
                                  "pretty output");
                   }});
}

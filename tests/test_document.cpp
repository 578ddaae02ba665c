#include "test_framework.hpp"

#include "scrubline/common/json_util.hpp"
#include "scrubline/document/locator.hpp"
#include "scrubline/document/message.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <string>
#include <vector>

namespace {

Json::Value parse(const std::string &text) {
  auto parsed = scrubline::common::json_parse_document(text);
  scrubline::tests::require(parsed.ok(), parsed.error());
  return parsed.value();
}

class PathCollector final : public scrubline::document::INodeVisitor {
public:
  bool visit_object(const Json::Value &, const scrubline::document::NodePath &path) override {
    paths.push_back(path.to_string());
    return false;
  }

  std::vector<std::string> paths;
};

} // namespace

void register_document_tests(std::vector<scrubline::tests::TestCase> &tests) {
  using scrubline::tests::require;
  using scrubline::tests::require_text;
  namespace doc = scrubline::document;

  tests.push_back({"locate_top_level_messages", [] {
                     const auto chat = scrubline::testing::make_chat(
                         {{"system", "be brief"}, {"user", "hi"}, {"tool", "result"}});
                     const auto located = doc::locate_messages(chat);
                     require(located.has_value(), "messages expected");
                     require(located->size() == 3, "three messages");
                     require(located->path.to_string() == "$.messages", located->path.to_string());
                   }});

  tests.push_back({"locate_nested_messages_inside_wrapper", [] {
                     const auto root = parse(R"([{"request": {"body": {"messages": [
                         {"role": "user", "content": "x"}]}}}])");
                     const auto located = doc::locate_messages(root);
                     require(located.has_value(), "nested messages expected");
                     require(located->path.to_string() == "$[0].request.body.messages",
                             located->path.to_string());
                   }});

  tests.push_back({"locate_skips_lists_that_are_not_objects", [] {
                     const auto root = parse(R"({"a": {"messages": ["x", "y"]},
                                                 "b": {"messages": [{"role": "tool"}]}})");
                     const auto located = doc::locate_messages(root);
                     require(located.has_value(), "object list expected");
                     require(located->path.to_string() == "$.b.messages", located->path.to_string());
                   }});

  tests.push_back({"locate_honours_custom_key", [] {
                     const auto root = parse(R"({"history": [{"role": "tool", "content": "r"}]})");
                     require(!doc::locate_messages(root).has_value(), "default key misses");
                     const auto located =
                         doc::locate_messages(root, doc::LocatorOptions{.messages_key = "history"});
                     require(located.has_value(), "custom key finds the list");
                   }});

  tests.push_back({"locate_returns_nullopt_without_messages", [] {
                     require(!doc::locate_messages(parse(R"({"model": "m", "input": "x"})"))
                                  .has_value(),
                             "no messages expected");
                   }});

  tests.push_back({"walk_visits_objects_depth_first", [] {
                     const auto root = parse(R"({"a": {"b": {}}, "c": [{}, {"d": {}}]})");
                     PathCollector collector;
                     const bool stopped = doc::walk_objects(root, collector);
                     require(!stopped, "walk should run to completion");
                     const std::vector<std::string> expected = {"$", "$.a", "$.a.b", "$.c[0]",
                                                                "$.c[1]", "$.c[1].d"};
                     require(collector.paths == expected, "visit order");
                   }});

  tests.push_back({"resolve_path_finds_and_misses", [] {
                     auto root = parse(R"({"x": [{"messages": []}]})");
                     doc::NodePath path;
                     path = path.child(std::string("x")).child(Json::ArrayIndex{0});
                     Json::Value *node = doc::resolve_path(root, path);
                     require(node != nullptr && node->isObject(), "path should resolve");
                     const auto missing = path.child(std::string("absent"));
                     require(doc::resolve_path(root, missing) == nullptr, "missing key");
                   }});

  tests.push_back({"message_text_handles_strings_and_parts", [] {
                     const auto plain = scrubline::testing::make_message("tool", "result");
                     require(doc::message_text(plain).value_or("") == "result", "string content");

                     const auto parts = parse(R"({"role": "tool", "content": [
                         {"type": "text", "text": "one"}, {"type": "image"},
                         {"type": "text", "text": "two"}]})");
                     require(doc::message_text(parts).value_or("") == "one\ntwo", "joined parts");

                     const auto none = parse(R"({"role": "assistant", "content": null})");
                     require(!doc::message_text(none).has_value(), "null content");
                   }});

  tests.push_back({"roles_parse_case_insensitively", [] {
                     require(doc::parse_role("Tool") == doc::Role::Tool, "Tool");
                     require(doc::parse_role(" ASSISTANT ") == doc::Role::Assistant, "ASSISTANT");
                     require(doc::parse_role("function") == doc::Role::Unknown, "unknown role");
                     require(doc::role_name(doc::Role::User) == "user", "role name");
                   }});

  tests.push_back({"selectors_match_role_and_index", [] {
                     const auto message = scrubline::testing::make_message("tool", "x");
                     const auto by_role = doc::select_role(doc::Role::Tool);
                     require_text(by_role.description, "role=tool", "by_role.description");
                     require(by_role.matches(message, 7), "role match");

                     const auto by_index = doc::select_index(2);
                     require(by_index.matches(message, 2) && !by_index.matches(message, 1),
                             "index match");
                   }});

  tests.push_back({"locate_takes_first_list_in_document_order", [] {
                     const auto root = parse(R"({"z": {"messages": [{"role": "tool", "content": "A"}]},
                                                 "a": {"messages": [{"role": "tool", "content": "B"}]}})");
                     const auto located = doc::locate_messages(root);
                     require(located.has_value(), "messages expected");
                     require_text(located->path.to_string(), "$.z.messages", "located path");
                   }});

  tests.push_back({"walk_follows_member_order_of_the_source", [] {
                     const auto root = parse(R"({"c": {}, "a": {"b": {}}})");
                     PathCollector collector;
                     doc::walk_objects(root, collector);
                     const std::vector<std::string> expected = {"$", "$.c", "$.a", "$.a.b"};
                     require(collector.paths == expected, "visit order");
                   }});
}

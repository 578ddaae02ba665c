#include "test_framework.hpp"

#include "scrubline/common/json_util.hpp"
#include "scrubline/toolcalls/normalizer.hpp"

#include <string>

namespace {

Json::Value parse(const std::string &text) {
  auto parsed = scrubline::common::json_parse(text);
  scrubline::tests::require(parsed.ok(), parsed.error());
  return parsed.value();
}

Json::Value tool_call(const std::string &name, const std::string &arguments) {
  Json::Value call(Json::objectValue);
  call["id"] = "call_1";
  call["type"] = "function";
  call["function"]["name"] = name;
  call["function"]["arguments"] = arguments;
  return call;
}

Json::Value single(const Json::Value &call) {
  Json::Value calls(Json::arrayValue);
  calls.append(call);
  return calls;
}

} // namespace

void register_toolcalls_tests(std::vector<scrubline::tests::TestCase> &tests) {
  using scrubline::tests::require;
  namespace tc = scrubline::toolcalls;
  using scrubline::common::ErrorKind;

  tests.push_back({"description_is_dropped_from_arguments", [] {
                     const auto result = tc::normalize_tool_calls(
                         single(tool_call("read_file", R"({"x":1,"description":"d"})")));
                     require(result.changed, "should change");
                     require(result.tool_calls[0u]["function"]["arguments"].asString() == "{\"x\":1}",
                             result.tool_calls[0u]["function"]["arguments"].asString());
                     require(result.notes.size() == 1, "one note");
                     require(result.notes[0].kind == ErrorKind::None, "repair note");
                   }});

  tests.push_back({"function_name_is_lowercased", [] {
                     const auto result =
                         tc::normalize_tool_calls(single(tool_call("Read_File", R"({"p":"a"})")));
                     require(result.tool_calls[0u]["function"]["name"].asString() == "read_file",
                             "name lowercased");
                     require(result.tool_calls[0u]["id"].asString() == "call_1", "id kept");
                   }});

  tests.push_back({"unparseable_arguments_become_empty_object", [] {
                     const auto result =
                         tc::normalize_tool_calls(single(tool_call("run", "{not json")));
                     require(result.tool_calls[0u]["function"]["arguments"].asString() == "{}",
                             "empty object");
                     require(result.notes.size() == 1, "one note");
                     require(result.notes[0].kind == ErrorKind::ArgumentsParseFailure, "kind");

                     const auto array_args = tc::normalize_tool_calls(single(tool_call("run", "[1]")));
                     require(array_args.tool_calls[0u]["function"]["arguments"].asString() == "{}",
                             "non-object arguments replaced");
                   }});

  tests.push_back({"inline_object_arguments_are_serialized_in_their_own_order", [] {
                     auto call = tool_call("run", "");
                     call["function"]["arguments"] = parse(R"({"b": 2, "a": 1})");
                     const auto result = tc::normalize_tool_calls(single(call));
                     require(result.tool_calls[0u]["function"]["arguments"].asString() ==
                                 "{\"b\":2,\"a\":1}",
                             result.tool_calls[0u]["function"]["arguments"].asString());
                     require(result.notes.empty(), "no notes for a valid object");
                   }});

  tests.push_back({"canonical_calls_are_unchanged", [] {
                     const auto calls = single(tool_call("read_file", "{\"path\":\"a.txt\"}"));
                     const auto result = tc::normalize_tool_calls(calls);
                     require(!result.changed, "should not change");
                     require(result.tool_calls == calls, "same value");
                     require(tc::validate_tool_calls(calls).ok(), "already canonical");
                   }});

  tests.push_back({"malformed_elements_are_reported", [] {
                     Json::Value calls(Json::arrayValue);
                     calls.append("not an object");
                     calls.append(parse(R"({"id": "c", "type": "function"})"));
                     const auto result = tc::normalize_tool_calls(calls);
                     require(result.notes.size() == 2, "two notes");
                     require(result.notes[0].kind == ErrorKind::FormatError, "first kind");
                     require(result.notes[1].index == 1, "second index");
                     require(!result.changed, "nothing rewritten");
                   }});

  tests.push_back({"validation_names_the_offending_field", [] {
                     Json::Value calls(Json::arrayValue);
                     calls.append(tool_call("ok", "{}"));
                     calls.append(tool_call("Bad", "{}"));
                     const auto status = tc::validate_tool_calls(calls);
                     require(!status.ok(), "should fail");
                     require(status.kind() == ErrorKind::FormatError, "kind");
                     require(status.error().find("tool_calls[1].function.name") != std::string::npos,
                             status.error());

                     const auto described = tc::validate_tool_calls(
                         single(tool_call("ok", R"({"description":"x"})")));
                     require(!described.ok(), "description must be rejected");
                   }});

  tests.push_back({"document_normalization_touches_only_assistant_calls", [] {
                     auto document = parse(R"({"messages": [
                         {"role": "user", "content": "go"},
                         {"role": "assistant", "content": null, "tool_calls": [
                           {"id": "c1", "type": "function",
                            "function": {"name": "Search", "arguments": "{\"q\":\"x\",\"description\":\"d\"}"}}]},
                         {"role": "tool", "tool_call_id": "c1", "content": "done"}]})");
                     const auto before = document;
                     auto report = tc::normalize_document_tool_calls(document);
                     require(report.ok(), report.error());
                     require(report.value().messages_changed == 1, "one message rewritten");
                     require(report.value().calls_seen == 1, "one call seen");
                     require(report.value().notes.size() == 2, "two notes");

                     const auto &call = document["messages"][1u]["tool_calls"][0u];
                     require(call["function"]["name"].asString() == "search", "name");
                     require(call["function"]["arguments"].asString() == "{\"q\":\"x\"}",
                             call["function"]["arguments"].asString());
                     require(document["messages"][0u] == before["messages"][0u], "user untouched");
                     require(document["messages"][2u] == before["messages"][2u], "tool untouched");
                     require(tc::validate_document_tool_calls(document).ok(), "now canonical");
                   }});

  tests.push_back({"document_without_messages_reports_not_found", [] {
                     auto document = parse(R"({"input": "x"})");
                     auto report = tc::normalize_document_tool_calls(document);
                     require(!report.ok(), "should fail");
                     require(report.kind() == ErrorKind::NoMessagesFound, "kind");
                     const auto status = tc::validate_document_tool_calls(document);
                     require(status.kind() == ErrorKind::NoMessagesFound, "validate kind");
                   }});

  tests.push_back({"document_normalization_keeps_member_order", [] {
                     const std::string before =
                         R"({"messages":[{"role":"assistant","tool_calls":[{"type":"function",)"
                         R"("id":"c1","function":{"name":"Run","arguments":"{\"z\":1,\"a\":2}"}}],)"
                         R"("content":""}]})";
                     auto document = parse(before);
                     auto report = tc::normalize_document_tool_calls(document);
                     require(report.ok(), report.error());
                     require(report.value().messages_changed == 1, "one message rewritten");
                     const std::string after = scrubline::common::json_write_compact(document);
                     require(after ==
                                 R"({"messages":[{"role":"assistant","tool_calls":[{"type":"function",)"
                                 R"("id":"c1","function":{"name":"run","arguments":"{\"z\":1,\"a\":2}"}}],)"
                                 R"("content":""}]})",
                             after);
                   }});
}

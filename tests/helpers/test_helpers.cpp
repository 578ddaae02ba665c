#include "tests/helpers/test_helpers.hpp"

#include <fstream>
#include <random>
#include <sstream>

namespace scrubline::testing {

config::Config mock_config() {
  config::Config config;
  config.selector.role = "tool";
  config.sanitizer.max_length = 10000;
  config.sanitizer.max_lines = 200;
  config.output.indent = 2;
  config.observability.backend = "none";
  return config;
}

Json::Value make_message(const std::string &role, const std::string &content) {
  Json::Value message(Json::objectValue);
  message["role"] = role;
  message["content"] = content;
  return message;
}

Json::Value make_chat(std::initializer_list<std::pair<std::string, std::string>> messages) {
  Json::Value chat(Json::objectValue);
  chat["model"] = "test-model";
  chat["messages"] = Json::Value(Json::arrayValue);
  for (const auto &[role, content] : messages) {
    chat["messages"].append(make_message(role, content));
  }
  return chat;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("scrubline-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc | std::ios::binary);
  out << content;
}

std::string TempWorkspace::read_file(const std::string &name) const {
  std::ifstream in(path_ / name, std::ios::binary);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

} // namespace scrubline::testing

#include "scrubline/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>

namespace scrubline::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("Failed to create directory: " +
                                                  path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  static const std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

std::string read_stream(std::istream &in) {
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

Result<std::string> read_text(const std::string &path) {
  if (path == "-") {
    return Result<std::string>::success(read_stream(std::cin));
  }

  const std::filesystem::path file_path(expand_path(path));
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    return Result<std::string>::failure("No such file: " + file_path.string());
  }

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    return Result<std::string>::failure("Unable to open file: " + file_path.string());
  }
  return Result<std::string>::success(read_stream(file));
}

Status write_text(const std::string &path, const std::string &content) {
  if (path == "-") {
    std::cout << content;
    std::cout.flush();
    return std::cout ? Status::success() : Status::error("Failed to write standard output");
  }

  const std::filesystem::path target(expand_path(path));
  if (target.has_parent_path()) {
    if (auto dir = ensure_dir(target.parent_path()); !dir.ok()) {
      return Status::error(dir.error());
    }
  }

  std::filesystem::path staging = target;
  staging += ".tmp";
  {
    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    if (!out) {
      return Status::error("Unable to open file for writing: " + staging.string());
    }
    out << content;
    if (!out) {
      return Status::error("Failed to write file: " + staging.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(staging, target, ec);
  if (ec) {
    std::filesystem::remove(staging, ec);
    return Status::error("Failed to replace " + target.string());
  }
  return Status::success();
}

} // namespace scrubline::common

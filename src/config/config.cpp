#include "scrubline/config/config.hpp"

#include "scrubline/common/fs.hpp"
#include "scrubline/common/toml.hpp"
#include "scrubline/document/message.hpp"
#include "scrubline/observability/factory.hpp"
#include "scrubline/sanitize/rules.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace scrubline::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".scrubline";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("SCRUBLINE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::size_t> parse_size(const std::string &raw) {
  const std::string value = common::trim(raw);
  std::size_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last || first == last) {
    return std::nullopt;
  }
  return parsed;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += common::quote_toml_string(values[i]);
  }
  out += "]";
  return out;
}

} // namespace

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER /
                                                        CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *max_length = std::getenv("SCRUBLINE_MAX_LENGTH");
      max_length != nullptr && *max_length) {
    if (const auto parsed = parse_size(max_length); parsed.has_value()) {
      config.sanitizer.max_length = *parsed;
    }
  }

  if (const char *role = std::getenv("SCRUBLINE_ROLE"); role != nullptr && *role) {
    config.selector.role = role;
  }

  if (const char *backend = std::getenv("SCRUBLINE_OBSERVABILITY");
      backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.locator.messages_key = doc.get_string("locator.messages_key", config.locator.messages_key);

  config.selector.role = doc.get_string("selector.role", config.selector.role);
  config.selector.all = doc.get_bool("selector.all", config.selector.all);

  config.sanitizer.max_length = doc.get_size("sanitizer.max_length", config.sanitizer.max_length);
  config.sanitizer.max_lines = doc.get_size("sanitizer.max_lines", config.sanitizer.max_lines);
  config.sanitizer.max_stalled_passes =
      doc.get_size("sanitizer.max_stalled_passes", config.sanitizer.max_stalled_passes);
  config.sanitizer.disabled_rules =
      doc.get_string_array("sanitizer.disabled_rules", config.sanitizer.disabled_rules);

  config.tool_calls.normalize = doc.get_bool("tool_calls.normalize", config.tool_calls.normalize);

  config.output.indent = doc.get_int("output.indent", config.output.indent);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_text(path.string());
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[locator]\n";
  out << "messages_key = " << common::quote_toml_string(config.locator.messages_key) << "\n";

  out << "\n[selector]\n";
  out << "role = " << common::quote_toml_string(config.selector.role) << "\n";
  out << "all = " << bool_to_toml(config.selector.all) << "\n";

  out << "\n[sanitizer]\n";
  out << "max_length = " << config.sanitizer.max_length << "\n";
  out << "max_lines = " << config.sanitizer.max_lines << "\n";
  out << "max_stalled_passes = " << config.sanitizer.max_stalled_passes << "\n";
  out << "disabled_rules = " << string_array_to_toml(config.sanitizer.disabled_rules) << "\n";

  out << "\n[tool_calls]\n";
  out << "normalize = " << bool_to_toml(config.tool_calls.normalize) << "\n";

  out << "\n[output]\n";
  out << "indent = " << config.output.indent << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return out.str();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Validation = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (common::trim(config.locator.messages_key).empty()) {
    return Validation::failure("locator.messages_key must not be empty");
  }

  if (document::parse_role(config.selector.role) == document::Role::Unknown) {
    return Validation::failure("Invalid selector.role: " + config.selector.role);
  }

  const sanitize::RuleOptions rule_options{.max_length = config.sanitizer.max_length,
                                           .max_lines = config.sanitizer.max_lines};
  if (auto status = sanitize::validate_rule_options(rule_options); !status.ok()) {
    return Validation::failure("sanitizer." + status.error());
  }
  if (config.sanitizer.max_stalled_passes == 0) {
    return Validation::failure("sanitizer.max_stalled_passes must be at least 1");
  }
  for (const auto &rule : config.sanitizer.disabled_rules) {
    if (!sanitize::is_rule_name(rule)) {
      return Validation::failure("Unknown rule in sanitizer.disabled_rules: " + rule);
    }
  }

  if (!observability::is_known_backend(config.observability.backend)) {
    return Validation::failure("Invalid observability.backend: " + config.observability.backend);
  }

  if (config.output.indent < 0) {
    warnings.push_back("output.indent is negative; output will be compact");
  }
  if (config.sanitizer.max_stalled_passes > 16) {
    warnings.push_back("sanitizer.max_stalled_passes above 16 rarely changes the result");
  }
  const auto &disabled = config.sanitizer.disabled_rules;
  if (std::find(disabled.begin(), disabled.end(), "truncate_oversize") != disabled.end()) {
    warnings.push_back("truncate_oversize is disabled; oversized content passes through");
  }

  return Validation::success(std::move(warnings));
}

patch::PatchOptions patch_options(const Config &config) {
  patch::PatchOptions options;
  options.locator.messages_key = config.locator.messages_key;
  options.sanitizer.rules.max_length = config.sanitizer.max_length;
  options.sanitizer.rules.max_lines = config.sanitizer.max_lines;
  options.sanitizer.max_stalled_passes = config.sanitizer.max_stalled_passes;
  options.sanitizer.disabled_rules = config.sanitizer.disabled_rules;
  return options;
}

} // namespace scrubline::config

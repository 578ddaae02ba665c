#include "test_framework.hpp"

#include "scrubline/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = scrubline::config::config_path_override();
    if (next.has_value()) {
      scrubline::config::set_config_path_override(*next);
    } else {
      scrubline::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      scrubline::config::set_config_path_override(*old_override);
    } else {
      scrubline::config::clear_config_path_override();
    }
  }
};

bool has_warning(const std::vector<std::string> &warnings, const std::string &needle) {
  for (const auto &warning : warnings) {
    if (warning.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

void register_config_tests(std::vector<scrubline::tests::TestCase> &tests) {
  using scrubline::tests::require;
  namespace cfg = scrubline::config;

  tests.push_back({"config_defaults_are_valid", [] {
                     const cfg::Config config;
                     require(config.selector.role == "tool", "default role");
                     require(config.sanitizer.max_length == 10000, "default max_length");
                     require(config.sanitizer.max_lines == 200, "default max_lines");
                     require(config.tool_calls.normalize, "tool call normalization on");
                     const auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     require(validated.value().empty(), "no warnings for defaults");
                   }});

  tests.push_back({"config_parse_reads_every_section", [] {
                     const std::string toml = "[locator]\n"
                                              "messages_key = \"history\"\n"
                                              "[selector]\n"
                                              "role = \"assistant\"\n"
                                              "all = true\n"
                                              "[sanitizer]\n"
                                              "max_length = 2_000\n"
                                              "max_lines = 50\n"
                                              "max_stalled_passes = 6\n"
                                              "disabled_rules = [\"strip_markup\"]\n"
                                              "[tool_calls]\n"
                                              "normalize = false\n"
                                              "[output]\n"
                                              "indent = 0\n"
                                              "[observability]\n"
                                              "backend = \"verbose\"\n";
                     auto parsed = cfg::parse_config(toml);
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.locator.messages_key == "history", "messages_key");
                     require(config.selector.role == "assistant" && config.selector.all,
                             "selector");
                     require(config.sanitizer.max_length == 2000, "max_length");
                     require(config.sanitizer.max_lines == 50, "max_lines");
                     require(config.sanitizer.max_stalled_passes == 6, "max_stalled_passes");
                     require(config.sanitizer.disabled_rules.size() == 1, "disabled_rules");
                     require(!config.tool_calls.normalize, "normalize");
                     require(config.output.indent == 0, "indent");
                     require(config.observability.backend == "verbose", "backend");
                   }});

  tests.push_back({"config_render_round_trips", [] {
                     auto config = scrubline::testing::mock_config();
                     config.locator.messages_key = "turns";
                     config.sanitizer.disabled_rules = {"strip_links", "collapse_whitespace"};
                     config.sanitizer.max_lines = 0;
                     auto parsed = cfg::parse_config(cfg::render_config(config));
                     require(parsed.ok(), parsed.error());
                     const auto &back = parsed.value();
                     require(back.locator.messages_key == "turns", "messages_key");
                     require(back.sanitizer.disabled_rules == config.sanitizer.disabled_rules,
                             "disabled_rules");
                     require(back.sanitizer.max_lines == 0, "max_lines");
                     require(back.observability.backend == "none", "backend");
                   }});

  tests.push_back({"config_validation_rejects_bad_values", [] {
                     auto bad_role = scrubline::testing::mock_config();
                     bad_role.selector.role = "robot";
                     require(!cfg::validate_config(bad_role).ok(), "unknown role");

                     auto bad_length = scrubline::testing::mock_config();
                     bad_length.sanitizer.max_length = 3;
                     const auto length_result = cfg::validate_config(bad_length);
                     require(!length_result.ok(), "max_length too small");
                     require(length_result.error().find("sanitizer.max_length") != std::string::npos,
                             length_result.error());

                     auto bad_rule = scrubline::testing::mock_config();
                     bad_rule.sanitizer.disabled_rules = {"strip_all"};
                     require(!cfg::validate_config(bad_rule).ok(), "unknown rule");

                     auto bad_backend = scrubline::testing::mock_config();
                     bad_backend.observability.backend = "log,prometheus";
                     require(!cfg::validate_config(bad_backend).ok(), "unknown backend");

                     auto empty_key = scrubline::testing::mock_config();
                     empty_key.locator.messages_key = "  ";
                     require(!cfg::validate_config(empty_key).ok(), "empty messages_key");
                   }});

  tests.push_back({"config_validation_warns_on_soft_problems", [] {
                     auto config = scrubline::testing::mock_config();
                     config.output.indent = -1;
                     config.sanitizer.disabled_rules = {"truncate_oversize"};
                     const auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     require(has_warning(validated.value(), "output.indent"), "indent warning");
                     require(has_warning(validated.value(), "truncate_oversize"),
                             "truncate warning");
                   }});

  tests.push_back({"config_env_overrides_apply", [] {
                     const EnvGuard length("SCRUBLINE_MAX_LENGTH", std::string("777"));
                     const EnvGuard role("SCRUBLINE_ROLE", std::string("user"));
                     const EnvGuard backend("SCRUBLINE_OBSERVABILITY", std::string("noop"));
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.sanitizer.max_length == 777, "max_length override");
                     require(config.selector.role == "user", "role override");
                     require(config.observability.backend == "noop", "backend override");

                     const EnvGuard bad_length("SCRUBLINE_MAX_LENGTH", std::string("lots"));
                     cfg::Config untouched;
                     cfg::apply_env_overrides(untouched);
                     require(untouched.sanitizer.max_length == 10000, "invalid number ignored");
                   }});

  tests.push_back({"config_load_uses_override_path", [] {
                     scrubline::testing::TempWorkspace workspace;
                     workspace.create_file("custom.toml", "[sanitizer]\nmax_length = 1234\n");
                     const EnvGuard length("SCRUBLINE_MAX_LENGTH", std::nullopt);
                     const ConfigOverrideGuard guard(workspace.path() / "custom.toml");

                     auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == workspace.path() / "custom.toml", "override path");
                     require(cfg::config_exists(), "config should exist");

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().sanitizer.max_length == 1234, "value from file");
                   }});

  tests.push_back({"config_load_missing_file_gives_defaults", [] {
                     scrubline::testing::TempWorkspace workspace;
                     const EnvGuard length("SCRUBLINE_MAX_LENGTH", std::nullopt);
                     const EnvGuard role("SCRUBLINE_ROLE", std::nullopt);
                     const ConfigOverrideGuard guard(workspace.path() / "absent.toml");
                     require(!cfg::config_exists(), "config should not exist");
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().sanitizer.max_length == 10000, "default max_length");
                   }});

  tests.push_back({"config_load_reports_parse_errors_with_path", [] {
                     scrubline::testing::TempWorkspace workspace;
                     workspace.create_file("broken.toml", "[sanitizer]\nthis is not toml\n");
                     const ConfigOverrideGuard guard(workspace.path() / "broken.toml");
                     auto loaded = cfg::load_config();
                     require(!loaded.ok(), "should fail");
                     require(loaded.error().find("broken.toml") != std::string::npos,
                             loaded.error());
                   }});

  tests.push_back({"patch_options_follow_config", [] {
                     auto config = scrubline::testing::mock_config();
                     config.locator.messages_key = "turns";
                     config.sanitizer.max_length = 321;
                     config.sanitizer.max_stalled_passes = 2;
                     const auto options = cfg::patch_options(config);
                     require(options.locator.messages_key == "turns", "messages_key");
                     require(options.sanitizer.rules.max_length == 321, "max_length");
                     require(options.sanitizer.max_stalled_passes == 2, "max_stalled_passes");
                   }});
}

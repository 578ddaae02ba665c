#include "scrubline/cli/commands.hpp"

#include "scrubline/common/fs.hpp"
#include "scrubline/common/json_util.hpp"
#include "scrubline/config/config.hpp"
#include "scrubline/doctor/report.hpp"
#include "scrubline/document/locator.hpp"
#include "scrubline/document/message.hpp"
#include "scrubline/observability/factory.hpp"
#include "scrubline/observability/global.hpp"
#include "scrubline/patch/patcher.hpp"
#include "scrubline/toolcalls/normalizer.hpp"

#include <algorithm>
#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace scrubline::cli {

namespace {

std::string version_string() {
#ifdef SCRUBLINE_VERSION
  std::string version = SCRUBLINE_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "scrubline " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::optional<std::size_t> parse_count(const std::string &raw) {
  std::size_t parsed = 0;
  const auto *first = raw.data();
  const auto *last = first + raw.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last || first == last) {
    return std::nullopt;
  }
  return parsed;
}

// Whatever is left after options are taken: at most one input path.
bool take_input(std::vector<std::string> &args, std::string &input, std::string &error) {
  input = "-";
  for (const auto &arg : args) {
    if (arg != "-" && common::starts_with(arg, "-")) {
      error = "unknown option: " + arg;
      return false;
    }
  }
  if (args.size() > 1) {
    error = "unexpected argument: " + args[1];
    return false;
  }
  if (!args.empty()) {
    input = args[0];
  }
  args.clear();
  return true;
}

std::optional<config::Config> prepare_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return std::nullopt;
  }
  return cfg.value();
}

bool validate_and_observe(const config::Config &cfg) {
  const auto validated = config::validate_config(cfg);
  if (!validated.ok()) {
    std::cerr << "[FAIL] Config: " << validated.error() << "\n";
    return false;
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "[WARN] Config: " << warning << "\n";
  }
  observability::set_global_observer(observability::create_observer(cfg));
  return true;
}

std::optional<Json::Value> load_document(const std::string &input, const config::Config &cfg) {
  const auto text = common::read_text(input);
  if (!text.ok()) {
    std::cerr << text.error() << "\n";
    return std::nullopt;
  }
  auto parsed = common::json_parse_document(text.value());
  if (!parsed.ok()) {
    observability::record_error("document", parsed.error());
    std::cerr << parsed.error() << "\n";
    return std::nullopt;
  }

  const document::LocatorOptions locator{.messages_key = cfg.locator.messages_key};
  const auto located = document::locate_messages(parsed.value(), locator);
  observability::record_document_loaded(input == "-" ? "stdin" : input, text.value().size(),
                                         located.has_value() ? located->size() : 0);
  return parsed.value();
}

bool resolve_selector(const config::Config &cfg, const std::string &index_raw,
                      document::MessageSelector &selector) {
  if (!index_raw.empty()) {
    const auto index = parse_count(index_raw);
    if (!index.has_value()) {
      std::cerr << "invalid index: " << index_raw << "\n";
      return false;
    }
    selector = document::select_index(*index);
    return true;
  }
  const auto role = document::parse_role(cfg.selector.role);
  if (role == document::Role::Unknown) {
    std::cerr << "invalid role: " << cfg.selector.role << "\n";
    return false;
  }
  selector = document::select_role(role);
  return true;
}

// Options shared by analyze and fix, applied on top of the loaded config.
bool apply_selection_options(std::vector<std::string> &args, config::Config &cfg,
                             std::string &index_raw) {
  std::string value;
  if (take_option(args, "--role", "-r", value)) {
    cfg.selector.role = value;
  }
  if (take_flag(args, "--all")) {
    cfg.selector.all = true;
  }
  if (take_option(args, "--max-length", "", value)) {
    const auto parsed = parse_count(value);
    if (!parsed.has_value()) {
      std::cerr << "invalid max length: " << value << "\n";
      return false;
    }
    cfg.sanitizer.max_length = *parsed;
  }
  if (take_option(args, "--max-lines", "", value)) {
    const auto parsed = parse_count(value);
    if (!parsed.has_value()) {
      std::cerr << "invalid max lines: " << value << "\n";
      return false;
    }
    cfg.sanitizer.max_lines = *parsed;
  }
  if (take_option(args, "--index", "", value)) {
    index_raw = value;
  }
  if (take_flag(args, "--no-tool-calls")) {
    cfg.tool_calls.normalize = false;
  }
  return true;
}

common::Result<patch::PatchOutcome> run_patch(const Json::Value &doc, const config::Config &cfg,
                                              const document::MessageSelector &selector) {
  const auto options = config::patch_options(cfg);
  return cfg.selector.all ? patch::patch_all(doc, selector, options)
                          : patch::patch(doc, selector, options);
}

// Recoverable outcomes leave the document as it was and only warn.
void warn_recoverable(const patch::PatchReport &report) {
  if (report.status == patch::PatchStatus::NoMessagesFound ||
      report.status == patch::PatchStatus::NoMatchingMessage) {
    for (const auto &note : report.notes) {
      std::cerr << "[WARN] " << note << "\n";
    }
  }
}

int run_analyze(std::vector<std::string> args) {
  auto cfg = prepare_config();
  if (!cfg.has_value()) {
    return 1;
  }
  const bool as_json = take_flag(args, "--json");
  std::string index_raw;
  if (!apply_selection_options(args, *cfg, index_raw)) {
    return 1;
  }
  std::string input;
  std::string error;
  if (!take_input(args, input, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  if (!validate_and_observe(*cfg)) {
    return 1;
  }

  document::MessageSelector selector;
  if (!resolve_selector(*cfg, index_raw, selector)) {
    return 1;
  }
  auto doc = load_document(input, *cfg);
  if (!doc.has_value()) {
    return 1;
  }

  auto outcome = run_patch(*doc, *cfg, selector);
  if (!outcome.ok()) {
    std::cerr << outcome.error() << "\n";
    return 1;
  }

  std::optional<toolcalls::DocumentToolCallReport> tool_calls;
  if (cfg->tool_calls.normalize) {
    auto normalized = toolcalls::normalize_document_tool_calls(
        outcome.value().document, {.messages_key = cfg->locator.messages_key});
    if (normalized.ok()) {
      tool_calls = normalized.value();
    }
  }

  const auto &report = outcome.value().report;
  if (as_json) {
    std::cout << common::json_write(doctor::report_to_json(report, tool_calls),
                                    std::max(cfg->output.indent, 0))
              << "\n";
  } else {
    doctor::print_report(doctor::build_report(report, tool_calls), std::cout);
  }
  return 0;
}

int run_fix(std::vector<std::string> args) {
  auto cfg = prepare_config();
  if (!cfg.has_value()) {
    return 1;
  }
  std::string output = "-";
  std::string value;
  if (take_option(args, "--output", "-o", value)) {
    output = value;
  }
  if (take_option(args, "--indent", "", value)) {
    const auto parsed = parse_count(value);
    if (!parsed.has_value()) {
      std::cerr << "invalid indent: " << value << "\n";
      return 1;
    }
    cfg->output.indent = static_cast<int>(*parsed);
  }
  const bool with_report = take_flag(args, "--report");
  std::string index_raw;
  if (!apply_selection_options(args, *cfg, index_raw)) {
    return 1;
  }
  std::string input;
  std::string error;
  if (!take_input(args, input, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  if (!validate_and_observe(*cfg)) {
    return 1;
  }

  document::MessageSelector selector;
  if (!resolve_selector(*cfg, index_raw, selector)) {
    return 1;
  }
  auto doc = load_document(input, *cfg);
  if (!doc.has_value()) {
    return 1;
  }

  auto outcome = run_patch(*doc, *cfg, selector);
  if (!outcome.ok()) {
    std::cerr << outcome.error() << "\n";
    return 1;
  }
  auto &patched = outcome.value();
  warn_recoverable(patched.report);

  std::optional<toolcalls::DocumentToolCallReport> tool_calls;
  if (cfg->tool_calls.normalize) {
    auto normalized = toolcalls::normalize_document_tool_calls(
        patched.document, {.messages_key = cfg->locator.messages_key});
    if (normalized.ok()) {
      tool_calls = normalized.value();
    }
  }

  auto written =
      common::write_text(output, common::json_write(patched.document, cfg->output.indent) + "\n");
  if (!written.ok()) {
    observability::record_error("output", written.error());
    std::cerr << written.error() << "\n";
    return 1;
  }

  if (with_report) {
    const auto report = doctor::build_report(patched.report, tool_calls);
    doctor::print_report(report, output == "-" ? std::cerr : std::cout);
  }
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return 0;
}

int run_check_tools(std::vector<std::string> args) {
  auto cfg = prepare_config();
  if (!cfg.has_value()) {
    return 1;
  }
  std::string input;
  std::string error;
  if (!take_input(args, input, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  if (!validate_and_observe(*cfg)) {
    return 1;
  }
  auto doc = load_document(input, *cfg);
  if (!doc.has_value()) {
    return 1;
  }

  const auto status =
      toolcalls::validate_document_tool_calls(*doc, {.messages_key = cfg->locator.messages_key});
  if (status.ok()) {
    std::cout << "[PASS] Tool calls: canonical\n";
    return 0;
  }
  if (status.kind() == common::ErrorKind::NoMessagesFound) {
    std::cout << "[WARN] Tool calls: " << status.error() << "\n";
    return 0;
  }
  std::cout << "[FAIL] Tool calls: " << status.error() << "\n";
  return 1;
}

int run_config(std::vector<std::string> args) {
  auto cfg = prepare_config();
  if (!cfg.has_value()) {
    return 1;
  }

  if (args.empty() || args[0] == "show") {
    std::cout << config::render_config(*cfg);
    return 0;
  }

  if (args[0] == "validate") {
    const auto validated = config::validate_config(*cfg);
    if (!validated.ok()) {
      std::cout << "[FAIL] Config: " << validated.error() << "\n";
      return 1;
    }
    for (const auto &warning : validated.value()) {
      std::cout << "[WARN] Config: " << warning << "\n";
    }
    std::cout << "[PASS] Config: valid\n";
    return 0;
  }

  std::cerr << "usage: scrubline config [show|validate]\n";
  return 1;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: scrubline [--config PATH] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  analyze [FILE|-] [--json]          Report hazards without changing anything\n";
  std::cout << "  fix [FILE|-] [-o OUT] [--report]   Sanitize the document and write it out\n";
  std::cout << "  check-tools [FILE|-]               Verify assistant tool_calls are canonical\n";
  std::cout << "  config [show|validate]             Display or validate configuration\n";
  std::cout << "  config-path                        Print the configuration file path\n";
  std::cout << "  version                            Print version\n";
  std::cout << "  help                               Show this help\n\n";
  std::cout << "Selection options (analyze, fix):\n";
  std::cout << "  --role ROLE        Patch the last message with ROLE (default: tool)\n";
  std::cout << "  --all              Patch every message with ROLE\n";
  std::cout << "  --index N          Patch the message at index N\n";
  std::cout << "  --max-length N     Length ceiling for message content\n";
  std::cout << "  --max-lines N      Line ceiling for message content\n";
  std::cout << "  --no-tool-calls    Leave assistant tool_calls alone\n";
  std::cout << "  --indent N         Output indentation for fix (0 = compact)\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "analyze") {
    return run_analyze(std::move(args));
  }
  if (subcommand == "fix") {
    return run_fix(std::move(args));
  }
  if (subcommand == "check-tools") {
    return run_check_tools(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace scrubline::cli

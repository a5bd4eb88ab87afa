#include "textguard/cli/commands.hpp"

#include "textguard/common/fs.hpp"
#include "textguard/config/config.hpp"
#include "textguard/engine/finding.hpp"
#include "textguard/engine/techniques.hpp"
#include "textguard/observability/factory.hpp"
#include "textguard/observability/global.hpp"
#include "textguard/service/guard_service.hpp"
#include "textguard/service/render.hpp"

#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace textguard::cli {

namespace {

std::string version_string() {
#ifdef TEXTGUARD_VERSION
  std::string version = TEXTGUARD_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "textguard " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

// Removes `name value` from args. `out_value` stays empty when the option is
// absent; an option given as the last token is an error.
common::Status take_option(std::vector<std::string> &args, const std::string &long_name,
                           const std::string &short_name, std::optional<std::string> &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return common::Status::error("missing value for " + args[i]);
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return common::Status::success();
    }
  }
  return common::Status::success();
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

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

/// `-f FILE`, then positional words, then stdin.
common::Result<std::string> read_input_text(std::vector<std::string> &args) {
  std::optional<std::string> file;
  const auto taken = take_option(args, "--file", "-f", file);
  if (!taken.ok()) {
    return common::Result<std::string>::failure(taken.error());
  }
  if (file.has_value()) {
    return common::read_file(common::expand_path(*file));
  }
  if (!args.empty()) {
    return common::Result<std::string>::success(join_tokens(args));
  }
  return common::Result<std::string>::success(read_stdin_all());
}

common::Result<config::Config> load_checked_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    return common::Result<config::Config>::failure("invalid config: " + warnings.error());
  }
  for (const auto &warning : warnings.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return cfg;
}

int run_scan(service::GuardService &guard, const config::Config &cfg,
             std::vector<std::string> args) {
  auto text = read_input_text(args);
  if (!text.ok()) {
    std::cerr << text.error() << "\n";
    return kExitError;
  }

  auto result = guard.scan(text.value());
  if (!result.ok()) {
    std::cerr << result.error() << "\n";
    return kExitError;
  }
  std::cout << service::render_scan_result(result.value()) << "\n";

  const auto fail_level = engine::parse_threat_level(common::to_lower(common::trim(cfg.cli.fail_level)));
  if (fail_level.has_value() && result.value().threat_level >= *fail_level) {
    return kExitThreat;
  }
  return kExitOk;
}

int run_clean(service::GuardService &guard, std::vector<std::string> args) {
  const bool text_only = take_flag(args, "--text-only");
  auto text = read_input_text(args);
  if (!text.ok()) {
    std::cerr << text.error() << "\n";
    return kExitError;
  }

  auto result = guard.clean(text.value());
  if (!result.ok()) {
    std::cerr << result.error() << "\n";
    return kExitError;
  }
  if (text_only) {
    std::cout << result.value().cleaned_text << "\n";
  } else {
    std::cout << service::render_clean_result(result.value()) << "\n";
  }
  return kExitOk;
}

int run_history(service::GuardService &guard, std::vector<std::string> args) {
  if (!args.empty() && args[0] == "clear") {
    auto deleted = guard.clear_history();
    if (!deleted.ok()) {
      std::cerr << deleted.error() << "\n";
      return kExitError;
    }
    std::cout << "{\"deleted\":" << deleted.value() << "}\n";
    return kExitOk;
  }

  std::size_t limit = guard.options().default_history_limit;
  std::optional<std::string> limit_raw;
  const auto taken = take_option(args, "--limit", "-n", limit_raw);
  if (!taken.ok()) {
    std::cerr << taken.error() << "\n";
    return kExitError;
  }
  if (limit_raw.has_value()) {
    try {
      limit = static_cast<std::size_t>(std::stoul(*limit_raw));
    } catch (const std::exception &) {
      std::cerr << "invalid limit: " << *limit_raw << "\n";
      return kExitError;
    }
    if (limit < 1 || limit > config::kMaxHistoryLimit) {
      std::cerr << "limit must be between 1 and " << config::kMaxHistoryLimit << "\n";
      return kExitError;
    }
  }
  if (!args.empty()) {
    std::cerr << "usage: textguard history [--limit N] | history clear\n";
    return kExitError;
  }

  auto entries = guard.list_history(limit);
  if (!entries.ok()) {
    std::cerr << entries.error() << "\n";
    return kExitError;
  }
  std::cout << service::render_history(entries.value()) << "\n";
  return kExitOk;
}

int run_config(std::vector<std::string> args) {
  if (args.empty() || args[0] != "init") {
    std::cerr << "usage: textguard config init\n";
    return kExitError;
  }
  if (config::config_exists()) {
    std::cerr << "config already exists\n";
    return kExitError;
  }
  const auto saved = config::save_config(config::Config{});
  if (!saved.ok()) {
    std::cerr << saved.error() << "\n";
    return kExitError;
  }
  auto path = config::config_path();
  if (path.ok()) {
    std::cout << path.value().string() << "\n";
  }
  return kExitOk;
}

} // namespace

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: textguard [--config PATH] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  scan [TEXT | -f FILE]                Scan text for prompt injection (stdin "
               "when no TEXT)\n";
  std::cout << "  clean [TEXT | -f FILE] [--text-only] Strip hidden and confusable characters\n";
  std::cout << "  history [--limit N]                  List recent scans, newest first\n";
  std::cout << "  history clear                        Delete the scan history\n";
  std::cout << "  techniques                           List known obfuscation techniques\n";
  std::cout << "  config init                          Write a default config file\n";
  std::cout << "  config-path                          Print the config file location\n";
  std::cout << "  version                              Show version\n";
  std::cout << "  help                                 Show this help\n\n";
  std::cout << "scan exits with 2 when the threat level reaches cli.fail_level.\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return kExitError;
  }

  if (args.empty()) {
    print_help();
    return kExitOk;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return kExitOk;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return kExitOk;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return kExitError;
    }
    std::cout << path_result.value().string() << "\n";
    return kExitOk;
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }
  if (subcommand == "techniques") {
    std::cout << service::render_techniques(engine::technique_catalog()) << "\n";
    return kExitOk;
  }

  if (subcommand != "scan" && subcommand != "clean" && subcommand != "history") {
    std::cerr << "Unknown command: " << subcommand << "\n";
    print_help();
    return kExitError;
  }

  auto cfg = load_checked_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return kExitError;
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));

  auto guard = service::create_guard_service(cfg.value());
  if (!guard.ok()) {
    std::cerr << guard.error() << "\n";
    return kExitError;
  }

  int code = kExitOk;
  if (subcommand == "scan") {
    code = run_scan(*guard.value(), cfg.value(), std::move(args));
  } else if (subcommand == "clean") {
    code = run_clean(*guard.value(), std::move(args));
  } else {
    code = run_history(*guard.value(), std::move(args));
  }

  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return code;
}

} // namespace textguard::cli

#include "textguard/config/config.hpp"

#include "textguard/common/fs.hpp"
#include "textguard/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace textguard::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".textguard";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("TEXTGUARD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    const std::string value = strip_env_quotes(trimmed.substr(eq + 1));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, value);
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("TEXTGUARD_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  // Config dir .env wins over the working directory one.
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

bool is_known_level(const std::string &level) {
  return level == "safe" || level == "low" || level == "medium" || level == "high" ||
         level == "critical";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
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

std::string expand_config_path(const std::string &path) { return common::expand_path(path); }

std::filesystem::path history_db_path(const Config &config) {
  const std::string configured = common::trim(config.history.path);
  if (!configured.empty()) {
    return std::filesystem::path(expand_config_path(configured));
  }
  if (const auto dir = config_dir(); dir.ok()) {
    return dir.value() / "history.db";
  }
  return std::filesystem::path("history.db");
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *backend = std::getenv("TEXTGUARD_HISTORY_BACKEND");
      backend != nullptr && *backend) {
    config.history.backend = backend;
  }

  if (const char *observability = std::getenv("TEXTGUARD_OBSERVABILITY");
      observability != nullptr && *observability) {
    config.observability.backend = observability;
  }
}

common::Result<Config> load_config() {
  load_dotenv_files();

  Config config;

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + content.error());
  }

  const auto parsed = common::parse_toml(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }

  const auto &doc = parsed.value();
  config.scan.max_input_chars = doc.get_u64("scan.max_input_chars", config.scan.max_input_chars);

  config.detectors.hex = doc.get_bool("detectors.hex", config.detectors.hex);
  config.detectors.rot13 = doc.get_bool("detectors.rot13", config.detectors.rot13);

  config.history.backend = doc.get_string("history.backend", config.history.backend);
  config.history.path = doc.get_string("history.path", config.history.path);
  config.history.default_limit =
      doc.get_u64("history.default_limit", config.history.default_limit);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  config.cli.fail_level = doc.get_string("cli.fail_level", config.cli.fail_level);

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }

  file << "[scan]\n";
  file << "max_input_chars = " << config.scan.max_input_chars << "\n";

  file << "\n[detectors]\n";
  file << "hex = " << bool_to_toml(config.detectors.hex) << "\n";
  file << "rot13 = " << bool_to_toml(config.detectors.rot13) << "\n";

  file << "\n[history]\n";
  file << "backend = " << common::quote_toml_string(config.history.backend) << "\n";
  file << "path = " << common::quote_toml_string(config.history.path) << "\n";
  file << "default_limit = " << config.history.default_limit << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  file << "\n[cli]\n";
  file << "fail_level = " << common::quote_toml_string(config.cli.fail_level) << "\n";

  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message());
  }

  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (config.scan.max_input_chars == 0 || config.scan.max_input_chars > kMaxInputCharsCeiling) {
    return common::Result<std::vector<std::string>>::failure(
        "scan.max_input_chars must be between 1 and " + std::to_string(kMaxInputCharsCeiling));
  }

  const std::string history_backend = common::to_lower(common::trim(config.history.backend));
  if (history_backend != "sqlite" && history_backend != "none") {
    return common::Result<std::vector<std::string>>::failure("Invalid history.backend: " +
                                                              config.history.backend);
  }
  if (history_backend == "sqlite" && common::trim(config.history.path).empty()) {
    warnings.push_back("history.path is empty; using the config directory");
  }

  if (config.history.default_limit == 0 || config.history.default_limit > kMaxHistoryLimit) {
    return common::Result<std::vector<std::string>>::failure(
        "history.default_limit must be between 1 and " + std::to_string(kMaxHistoryLimit));
  }

  std::stringstream backends(common::to_lower(config.observability.backend));
  std::string part;
  while (std::getline(backends, part, ',')) {
    const std::string backend = common::trim(part);
    if (!backend.empty() && backend != "none" && backend != "noop" && backend != "log" &&
        backend != "stats") {
      return common::Result<std::vector<std::string>>::failure(
          "Invalid observability.backend: " + config.observability.backend);
    }
  }

  const std::string fail_level = common::to_lower(common::trim(config.cli.fail_level));
  if (!is_known_level(fail_level)) {
    return common::Result<std::vector<std::string>>::failure("Invalid cli.fail_level: " +
                                                              config.cli.fail_level);
  }
  if (fail_level == "safe") {
    warnings.push_back("cli.fail_level = \"safe\" makes every scan fail");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace textguard::config

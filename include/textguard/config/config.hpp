#pragma once

#include "textguard/common/result.hpp"
#include "textguard/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace textguard::config {

inline constexpr std::uint64_t kMaxInputCharsCeiling = 100'000;
inline constexpr std::uint64_t kMaxHistoryLimit = 10'000;

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] std::string expand_config_path(const std::string &path);

/// Resolved location of the scan history database.
[[nodiscard]] std::filesystem::path history_db_path(const Config &config);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace textguard::config

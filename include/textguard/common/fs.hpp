#pragma once

#include "textguard/common/result.hpp"
#include <filesystem>
#include <string>

namespace textguard::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);

/// ASCII-only lowering. Multi-byte UTF-8 sequences pass through untouched, so
/// byte offsets into the result line up with offsets into the input.
[[nodiscard]] std::string to_lower(std::string value);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

} // namespace textguard::common

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace textguard::common {

/// Escape a string for embedding inside a JSON string literal. Control
/// characters below U+0020 and DEL are written as \u00XX escapes.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Quote and escape: `abc` -> `"abc"`.
[[nodiscard]] std::string json_string(const std::string &value);

[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);
[[nodiscard]] std::string json_number_array(const std::vector<std::size_t> &values);

} // namespace textguard::common

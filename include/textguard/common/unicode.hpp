#pragma once

#include "textguard/common/result.hpp"
#include <string>

namespace textguard::common {

/// Any codepoint outside the control, format, surrogate, private-use,
/// unassigned and separator categories, plus U+0020.
[[nodiscard]] bool is_printable(char32_t cp);

/// is_printable() or Unicode whitespace. Used for the decoder's
/// printable-ratio check.
[[nodiscard]] bool is_printable_or_space(char32_t cp);

/// Unicode compatibility normalization (NFKC) of a UTF-8 string.
[[nodiscard]] Result<std::string> nfkc_normalize(const std::string &input);

} // namespace textguard::common

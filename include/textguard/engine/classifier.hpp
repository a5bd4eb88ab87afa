#pragma once

#include "textguard/engine/finding.hpp"
#include "textguard/engine/scan_text.hpp"

#include <vector>

namespace textguard::engine {

inline constexpr std::size_t kMaxHiddenContentChars = 100;

// One finding per distinct codepoint value present, in table order.
[[nodiscard]] std::vector<Finding> detect_zero_width(const ScanText &text);
[[nodiscard]] std::vector<Finding> detect_bidi(const ScanText &text);
[[nodiscard]] std::vector<Finding> detect_homoglyphs(const ScanText &text);

// One finding per distinct control codepoint, in first-occurrence order.
[[nodiscard]] std::vector<Finding> detect_control_chars(const ScanText &text);

/// A single ascii_smuggling finding covering every tag codepoint, with the
/// hidden ASCII message rebuilt from the tag offsets.
[[nodiscard]] std::vector<Finding> detect_tag_chars(const ScanText &text);

/// All five classifiers in order: zero-width, bidi, homoglyph, control, tag.
[[nodiscard]] std::vector<Finding> classify_codepoints(const ScanText &text);

/// Quoted rendition of a codepoint: the character itself when printable,
/// otherwise a `\xNN`, `\uNNNN` or `\UNNNNNNNN` escape.
[[nodiscard]] std::string quoted_codepoint(char32_t cp);

} // namespace textguard::engine

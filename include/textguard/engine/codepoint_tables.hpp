#pragma once

#include <array>

namespace textguard::engine {

struct CodepointEntry {
  char32_t codepoint;
  const char *description;
};

struct HomoglyphEntry {
  char32_t codepoint;
  /// Latin look-alike, UTF-8. Empty for entries that are simply dropped.
  const char *latin;
  const char *description;
};

inline constexpr char32_t kTagCharFirst = 0xE0000U;
inline constexpr char32_t kTagCharLast = 0xE007FU;

extern const std::array<CodepointEntry, 15> kZeroWidthChars;
extern const std::array<CodepointEntry, 9> kBidiChars;
extern const std::array<HomoglyphEntry, 40> kHomoglyphs;

[[nodiscard]] bool is_zero_width(char32_t cp);
[[nodiscard]] bool is_bidi_control(char32_t cp);
[[nodiscard]] const HomoglyphEntry *find_homoglyph(char32_t cp);

/// C0 controls other than tab, LF and CR, plus DEL and the C1 range.
[[nodiscard]] bool is_control_char(char32_t cp);
[[nodiscard]] bool is_tag_char(char32_t cp);

} // namespace textguard::engine

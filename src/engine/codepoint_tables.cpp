#include "textguard/engine/codepoint_tables.hpp"

#include <algorithm>

namespace textguard::engine {

const std::array<CodepointEntry, 15> kZeroWidthChars = {{
    {0x200BU, "Zero-width space (ZWSP)"},
    {0x200CU, "Zero-width non-joiner (ZWNJ)"},
    {0x200DU, "Zero-width joiner (ZWJ)"},
    {0xFEFFU, "Byte order mark / Zero-width no-break space"},
    {0x2060U, "Word joiner"},
    {0x180EU, "Mongolian vowel separator"},
    {0x00ADU, "Soft hyphen"},
    {0x034FU, "Combining grapheme joiner"},
    {0x061CU, "Arabic letter mark"},
    {0x115FU, "Hangul choseong filler"},
    {0x1160U, "Hangul jungseong filler"},
    {0x17B4U, "Khmer vowel inherent aq"},
    {0x17B5U, "Khmer vowel inherent aa"},
    {0x3164U, "Hangul filler"},
    {0xFFA0U, "Halfwidth hangul filler"},
}};

const std::array<CodepointEntry, 9> kBidiChars = {{
    {0x202AU, "Left-to-right embedding (LRE)"},
    {0x202BU, "Right-to-left embedding (RLE)"},
    {0x202CU, "Pop directional formatting (PDF)"},
    {0x202DU, "Left-to-right override (LRO)"},
    {0x202EU, "Right-to-left override (RLO)"},
    {0x2066U, "Left-to-right isolate (LRI)"},
    {0x2067U, "Right-to-left isolate (RLI)"},
    {0x2068U, "First strong isolate (FSI)"},
    {0x2069U, "Pop directional isolate (PDI)"},
}};

const std::array<HomoglyphEntry, 40> kHomoglyphs = {{
    // Cyrillic
    {0x0430U, "a", "Cyrillic small letter a"},
    {0x0435U, "e", "Cyrillic small letter ie"},
    {0x0456U, "i", "Cyrillic small letter byelorussian-ukrainian i"},
    {0x043EU, "o", "Cyrillic small letter o"},
    {0x0440U, "p", "Cyrillic small letter er"},
    {0x0441U, "c", "Cyrillic small letter es"},
    {0x0443U, "y", "Cyrillic small letter u"},
    {0x0445U, "x", "Cyrillic small letter ha"},
    {0x0410U, "A", "Cyrillic capital letter a"},
    {0x0412U, "B", "Cyrillic capital letter ve"},
    {0x0415U, "E", "Cyrillic capital letter ie"},
    {0x041AU, "K", "Cyrillic capital letter ka"},
    {0x041CU, "M", "Cyrillic capital letter em"},
    {0x041DU, "H", "Cyrillic capital letter en"},
    {0x041EU, "O", "Cyrillic capital letter o"},
    {0x0420U, "P", "Cyrillic capital letter er"},
    {0x0421U, "C", "Cyrillic capital letter es"},
    {0x0422U, "T", "Cyrillic capital letter te"},
    {0x0425U, "X", "Cyrillic capital letter ha"},
    // Greek
    {0x0391U, "A", "Greek capital letter alpha"},
    {0x0392U, "B", "Greek capital letter beta"},
    {0x0395U, "E", "Greek capital letter epsilon"},
    {0x0396U, "Z", "Greek capital letter zeta"},
    {0x0397U, "H", "Greek capital letter eta"},
    {0x0399U, "I", "Greek capital letter iota"},
    {0x039AU, "K", "Greek capital letter kappa"},
    {0x039CU, "M", "Greek capital letter mu"},
    {0x039DU, "N", "Greek capital letter nu"},
    {0x039FU, "O", "Greek capital letter omicron"},
    {0x03A1U, "P", "Greek capital letter rho"},
    {0x03A4U, "T", "Greek capital letter tau"},
    {0x03A5U, "Y", "Greek capital letter upsilon"},
    {0x03A7U, "X", "Greek capital letter chi"},
    {0x03B1U, "a", "Greek small letter alpha"},
    {0x03BFU, "o", "Greek small letter omicron"},
    {0x03C1U, "p", "Greek small letter rho"},
    {0x03C5U, "u", "Greek small letter upsilon"},
    {0x03C7U, "x", "Greek small letter chi"},
    // Control characters that render as nothing
    {0x0001U, "", "Start of heading"},
    {0x0002U, "", "Start of text"},
}};

bool is_zero_width(const char32_t cp) {
  return std::any_of(kZeroWidthChars.begin(), kZeroWidthChars.end(),
                     [cp](const CodepointEntry &entry) { return entry.codepoint == cp; });
}

bool is_bidi_control(const char32_t cp) {
  return std::any_of(kBidiChars.begin(), kBidiChars.end(),
                     [cp](const CodepointEntry &entry) { return entry.codepoint == cp; });
}

const HomoglyphEntry *find_homoglyph(const char32_t cp) {
  const auto it = std::find_if(kHomoglyphs.begin(), kHomoglyphs.end(),
                               [cp](const HomoglyphEntry &entry) { return entry.codepoint == cp; });
  return it == kHomoglyphs.end() ? nullptr : &*it;
}

bool is_control_char(const char32_t cp) {
  if (cp < 0x20U) {
    return cp != 0x09U && cp != 0x0AU && cp != 0x0DU;
  }
  return cp == 0x7FU || (cp >= 0x80U && cp <= 0x9FU);
}

bool is_tag_char(const char32_t cp) { return cp >= kTagCharFirst && cp <= kTagCharLast; }

} // namespace textguard::engine

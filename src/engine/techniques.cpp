#include "textguard/engine/techniques.hpp"

namespace textguard::engine {

const std::vector<TechniqueInfo> &technique_catalog() {
  static const std::vector<TechniqueInfo> catalog = {
      TechniqueInfo{"Zero-Width Characters",
                    "Invisible Unicode characters that can hide malicious payloads. Common in "
                    "ASCII smuggling attacks.",
                    Severity::High,
                    {"U+200B (ZWSP)", "U+200C (ZWNJ)", "U+200D (ZWJ)", "U+FEFF (BOM)"}},
      TechniqueInfo{"Bidirectional Overrides",
                    "Unicode characters that change text direction, used to visually hide "
                    "malicious content.",
                    Severity::High,
                    {"U+202E (RLO)", "U+202D (LRO)", "U+2066-2069 (Isolates)"}},
      TechniqueInfo{"Homoglyphs",
                    "Characters from different scripts that look identical to Latin letters. "
                    "Used to bypass filters.",
                    Severity::Medium,
                    {"Cyrillic '\xD0\xB0' vs Latin 'a'", "Greek '\xCE\xBF' vs Latin 'o'"}},
      TechniqueInfo{"Control Characters",
                    "ASCII and Unicode control characters that can disrupt processing.",
                    Severity::High,
                    {"NULL (U+0000)", "Escape (U+001B)", "Delete (U+007F)"}},
      TechniqueInfo{"ASCII Smuggling (Tag Chars)",
                    "Unicode tag characters (U+E0000-E007F) used to encode hidden ASCII messages.",
                    Severity::Critical,
                    {"Tag characters encode entire hidden prompts"}},
      TechniqueInfo{"Instruction Injection",
                    "Text patterns attempting to override system instructions.",
                    Severity::High,
                    {"'Ignore previous instructions'", "'New system prompt'", "'You are now...'"}},
      TechniqueInfo{"Base64 Payloads",
                    "Encoded content that may contain hidden instructions.",
                    Severity::High,
                    {"Base64 encoded override commands"}},
      TechniqueInfo{"Delimiter Injection",
                    "Attempts to break out of prompts using common delimiters.",
                    Severity::Medium,
                    {"```code blocks```", "[INST] markers", "### separators"}},
  };
  return catalog;
}

} // namespace textguard::engine

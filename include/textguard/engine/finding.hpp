#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace textguard::engine {

inline constexpr std::size_t kMaxReportedPositions = 10;
inline constexpr std::size_t kMaxReportedMatches = 5;
inline constexpr std::size_t kMaxReportedThreats = 5;

enum class Severity { Low, Medium, High, Critical };

/// Overall verdict for one scan. Ordered from least to most severe.
enum class ThreatLevel { Safe, Low, Medium, High, Critical };

enum class FindingType {
  ZeroWidth,
  BidiOverride,
  Homoglyph,
  ControlChar,
  AsciiSmuggling,
  InstructionInjection,
  EncodedPayload,
  DelimiterInjection,
};

enum class Encoding { Base64, Hex, Rot13 };

struct NestedLayer {
  std::size_t depth = 0;
  std::string preview;
};

/// One detected construct. Positions are codepoint offsets into the scanned
/// text. Optional members are present only for the finding types that carry
/// them.
struct Finding {
  FindingType type = FindingType::ZeroWidth;
  std::string description;
  Severity severity = Severity::Low;
  std::optional<std::size_t> count;
  std::vector<std::size_t> positions;

  // Codepoint classifier findings.
  std::optional<std::string> character;
  std::optional<std::string> unicode;
  std::optional<std::string> looks_like;
  std::optional<std::string> hidden_content;

  // Pattern findings.
  std::optional<std::string> pattern;
  std::vector<std::string> matches;

  // Encoded payload findings.
  std::optional<Encoding> encoding;
  std::optional<std::string> encoded_preview;
  std::optional<std::string> decoded_preview;
  std::optional<std::size_t> position;
  std::vector<std::string> threats_found;
  std::optional<std::size_t> layers;
  std::vector<NestedLayer> nested_layers;
  std::optional<std::string> encoded_word;
  std::optional<std::string> decoded_word;
  std::optional<std::string> decoded_context;
};

[[nodiscard]] std::string_view to_string(Severity severity);
[[nodiscard]] std::string_view to_string(ThreatLevel level);
[[nodiscard]] std::string_view to_string(FindingType type);
[[nodiscard]] std::string_view to_string(Encoding encoding);

[[nodiscard]] std::optional<ThreatLevel> parse_threat_level(std::string_view value);

} // namespace textguard::engine

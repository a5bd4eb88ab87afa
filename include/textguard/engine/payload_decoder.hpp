#pragma once

#include "textguard/engine/finding.hpp"
#include "textguard/engine/scan_text.hpp"

#include <optional>
#include <string>
#include <vector>

namespace textguard::engine {

inline constexpr std::size_t kMaxDecodeDepth = 5;
inline constexpr double kMinPrintableRatio = 0.7;
inline constexpr std::size_t kMinBase64Candidate = 16;
inline constexpr std::size_t kMinHexDecodedChars = 4;

/// One successfully peeled encoding layer, outermost first.
struct DecodeLayer {
  std::size_t depth = 0;
  std::string encoded_preview;
  std::string decoded_preview;
  std::string full_decoded;
};

/// Shape check only: whitespace stripped, padded to a multiple of four, base64
/// alphabet with at most two trailing `=`, at least eight characters.
[[nodiscard]] bool is_valid_base64(const std::string &candidate);

/// Raw bytes of a string that already passed is_valid_base64.
[[nodiscard]] std::optional<std::string> base64_decode(const std::string &candidate);

/// Fraction of codepoints that are printable or whitespace, U+FFFD excluded.
/// Empty input is 0.
[[nodiscard]] double printable_ratio(const std::u32string &decoded);

/// Peel base64 layers until a layer fails the shape check, decodes to less
/// than kMinPrintableRatio printable text, or max_depth is reached.
[[nodiscard]] std::vector<DecodeLayer> decode_base64_recursive(const std::string &text,
                                                               std::size_t max_depth =
                                                                   kMaxDecodeDepth);

/// Strips `0x`, `\x`, `%` and separators, then decodes pairs of hex digits.
/// Returns an empty string when what remains is not an even-length hex run.
[[nodiscard]] std::string hex_decode(const std::string &text);

[[nodiscard]] std::string rot13(const std::string &text);

[[nodiscard]] std::vector<Finding> detect_base64_payloads(const ScanText &text);
[[nodiscard]] std::vector<Finding> detect_hex_payloads(const ScanText &text);
[[nodiscard]] std::vector<Finding> detect_rot13_payloads(const ScanText &text);

} // namespace textguard::engine

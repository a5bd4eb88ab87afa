#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace textguard::common {

inline constexpr char32_t kReplacementCharacter = 0xFFFDU;

/// Decode one codepoint starting at `index` and advance past it. Malformed
/// sequences (bad lead byte, truncated or overlong sequence, surrogate, value
/// above U+10FFFF) consume a single byte and yield U+FFFD.
[[nodiscard]] char32_t next_codepoint(const std::string &input, std::size_t &index);

/// Lossy decode: every malformed byte becomes U+FFFD.
[[nodiscard]] std::u32string decode_utf8(const std::string &input);

[[nodiscard]] bool is_valid_utf8(const std::string &input);

void append_utf8(std::string &out, char32_t cp);
[[nodiscard]] std::string encode_utf8(const std::u32string &input);
[[nodiscard]] std::string encode_utf8(const std::u32string &input, std::size_t offset,
                                      std::size_t count);

[[nodiscard]] std::size_t codepoint_length(const std::string &input);

/// First `max_codepoints` codepoints of `input`, re-encoded.
[[nodiscard]] std::string utf8_prefix(const std::string &input, std::size_t max_codepoints);

/// `U+XXXX` with at least four upper-case hex digits.
[[nodiscard]] std::string codepoint_label(char32_t cp);

/// Maps every byte offset of `input` (plus one past the end) to the index of
/// the codepoint that contains it, using the same decoding as decode_utf8.
[[nodiscard]] std::vector<std::size_t> byte_to_codepoint_offsets(const std::string &input);

} // namespace textguard::common

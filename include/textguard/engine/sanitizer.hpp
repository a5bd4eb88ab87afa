#pragma once

#include "textguard/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace textguard::engine {

enum class RemovalCategory { ZeroWidth, Bidi, Homoglyph, Control, TagChars };

struct RemovedDetail {
  RemovalCategory category = RemovalCategory::ZeroWidth;
  std::size_t count = 0;
};

struct SanitizeOutcome {
  std::string cleaned_text;
  std::size_t original_length = 0;
  std::size_t cleaned_length = 0;
  /// original_length - cleaned_length; negative when NFKC expands the text.
  std::int64_t characters_removed = 0;
  std::vector<RemovedDetail> removed_details;
};

[[nodiscard]] std::string_view to_string(RemovalCategory category);

/// Deletes zero-width, bidi, control and tag codepoints, replaces homoglyphs
/// with their Latin look-alike, then applies NFKC. When NFKC produces table
/// codepoints of its own, the passes run again so the result is a fixed
/// point. Lengths are in codepoints; removed_details holds one entry per
/// category that changed anything.
[[nodiscard]] common::Result<SanitizeOutcome> sanitize_text(const std::string &text);

} // namespace textguard::engine

#include "textguard/engine/sanitizer.hpp"

#include "textguard/common/unicode.hpp"
#include "textguard/common/utf8.hpp"
#include "textguard/engine/codepoint_tables.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace textguard::engine {

namespace {

constexpr std::size_t kMaxSanitizeRounds = 4;
constexpr std::size_t kCategoryCount = 5;

using CategoryCounts = std::array<std::size_t, kCategoryCount>;

std::size_t index_of(const RemovalCategory category) { return static_cast<std::size_t>(category); }

template <typename Predicate>
std::size_t erase_matching(std::u32string &codepoints, Predicate matches) {
  const auto before = codepoints.size();
  codepoints.erase(std::remove_if(codepoints.begin(), codepoints.end(), matches),
                   codepoints.end());
  return before - codepoints.size();
}

std::size_t replace_homoglyphs(std::u32string &codepoints) {
  std::size_t replaced = 0;
  std::u32string out;
  out.reserve(codepoints.size());
  for (const char32_t cp : codepoints) {
    const auto *entry = find_homoglyph(cp);
    if (entry == nullptr) {
      out.push_back(cp);
      continue;
    }
    ++replaced;
    const std::u32string latin = common::decode_utf8(entry->latin);
    out += latin;
  }
  codepoints = std::move(out);
  return replaced;
}

void strip_pass(std::u32string &codepoints, CategoryCounts &counts) {
  counts[index_of(RemovalCategory::ZeroWidth)] += erase_matching(codepoints, is_zero_width);
  counts[index_of(RemovalCategory::Bidi)] += erase_matching(codepoints, is_bidi_control);
  counts[index_of(RemovalCategory::Homoglyph)] += replace_homoglyphs(codepoints);
  counts[index_of(RemovalCategory::Control)] += erase_matching(codepoints, is_control_char);
  counts[index_of(RemovalCategory::TagChars)] += erase_matching(codepoints, is_tag_char);
}

bool has_table_codepoint(const std::u32string &codepoints) {
  return std::any_of(codepoints.begin(), codepoints.end(), [](const char32_t cp) {
    return is_zero_width(cp) || is_bidi_control(cp) || find_homoglyph(cp) != nullptr ||
           is_control_char(cp) || is_tag_char(cp);
  });
}

} // namespace

std::string_view to_string(const RemovalCategory category) {
  switch (category) {
  case RemovalCategory::ZeroWidth:
    return "zero_width";
  case RemovalCategory::Bidi:
    return "bidi";
  case RemovalCategory::Homoglyph:
    return "homoglyph";
  case RemovalCategory::Control:
    return "control";
  case RemovalCategory::TagChars:
    return "tag_chars";
  }
  return "zero_width";
}

common::Result<SanitizeOutcome> sanitize_text(const std::string &text) {
  std::u32string codepoints = common::decode_utf8(text);
  const std::size_t original_length = codepoints.size();
  CategoryCounts counts{};

  for (std::size_t round = 0; round < kMaxSanitizeRounds; ++round) {
    strip_pass(codepoints, counts);
    auto normalized = common::nfkc_normalize(common::encode_utf8(codepoints));
    if (!normalized.ok()) {
      return common::Result<SanitizeOutcome>::failure(normalized.error());
    }
    codepoints = common::decode_utf8(normalized.value());
    if (!has_table_codepoint(codepoints)) {
      break;
    }
  }

  SanitizeOutcome outcome;
  outcome.cleaned_text = common::encode_utf8(codepoints);
  outcome.original_length = original_length;
  outcome.cleaned_length = codepoints.size();
  outcome.characters_removed =
      static_cast<std::int64_t>(original_length) - static_cast<std::int64_t>(codepoints.size());
  for (std::size_t i = 0; i < kCategoryCount; ++i) {
    if (counts[i] > 0) {
      outcome.removed_details.push_back(
          RemovedDetail{static_cast<RemovalCategory>(i), counts[i]});
    }
  }
  return common::Result<SanitizeOutcome>::success(std::move(outcome));
}

} // namespace textguard::engine

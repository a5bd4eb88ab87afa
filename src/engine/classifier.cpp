#include "textguard/engine/classifier.hpp"

#include "textguard/common/unicode.hpp"
#include "textguard/common/utf8.hpp"
#include "textguard/engine/codepoint_tables.hpp"

#include <cstdio>
#include <iterator>
#include <unordered_map>
#include <utility>

namespace textguard::engine {

namespace {

struct Occurrences {
  std::size_t count = 0;
  std::vector<std::size_t> positions;

  void add(const std::size_t position) {
    ++count;
    if (positions.size() < kMaxReportedPositions) {
      positions.push_back(position);
    }
  }
};

template <typename Predicate>
std::unordered_map<char32_t, Occurrences> collect(const ScanText &text, Predicate matches) {
  std::unordered_map<char32_t, Occurrences> found;
  const auto &codepoints = text.codepoints();
  for (std::size_t i = 0; i < codepoints.size(); ++i) {
    if (matches(codepoints[i])) {
      found[codepoints[i]].add(i);
    }
  }
  return found;
}

Finding make_codepoint_finding(const FindingType type, const char32_t cp,
                               std::string description, const Severity severity,
                               Occurrences occurrences) {
  Finding finding;
  finding.type = type;
  finding.description = std::move(description);
  finding.severity = severity;
  finding.count = occurrences.count;
  finding.positions = std::move(occurrences.positions);
  finding.character = quoted_codepoint(cp);
  finding.unicode = common::codepoint_label(cp);
  return finding;
}

template <std::size_t N>
std::vector<Finding> detect_table(const ScanText &text, const std::array<CodepointEntry, N> &table,
                                  const FindingType type) {
  auto found = collect(text, [&table](const char32_t cp) {
    for (const auto &entry : table) {
      if (entry.codepoint == cp) {
        return true;
      }
    }
    return false;
  });

  std::vector<Finding> findings;
  for (const auto &entry : table) {
    const auto it = found.find(entry.codepoint);
    if (it == found.end()) {
      continue;
    }
    findings.push_back(make_codepoint_finding(type, entry.codepoint, entry.description,
                                              Severity::High, std::move(it->second)));
  }
  return findings;
}

} // namespace

std::string quoted_codepoint(const char32_t cp) {
  std::string out = "'";
  if (common::is_printable(cp)) {
    common::append_utf8(out, cp);
  } else {
    char buf[16];
    if (cp < 0x100U) {
      std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned int>(cp));
    } else if (cp < 0x10000U) {
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(cp));
    } else {
      std::snprintf(buf, sizeof(buf), "\\U%08x", static_cast<unsigned int>(cp));
    }
    out += buf;
  }
  out.push_back('\'');
  return out;
}

std::vector<Finding> detect_zero_width(const ScanText &text) {
  return detect_table(text, kZeroWidthChars, FindingType::ZeroWidth);
}

std::vector<Finding> detect_bidi(const ScanText &text) {
  return detect_table(text, kBidiChars, FindingType::BidiOverride);
}

std::vector<Finding> detect_homoglyphs(const ScanText &text) {
  auto found = collect(text, [](const char32_t cp) { return find_homoglyph(cp) != nullptr; });

  std::vector<Finding> findings;
  for (const auto &entry : kHomoglyphs) {
    const auto it = found.find(entry.codepoint);
    if (it == found.end()) {
      continue;
    }
    auto finding = make_codepoint_finding(FindingType::Homoglyph, entry.codepoint,
                                          entry.description, Severity::Medium,
                                          std::move(it->second));
    std::string character;
    common::append_utf8(character, entry.codepoint);
    finding.character = std::move(character);
    finding.looks_like = entry.latin;
    findings.push_back(std::move(finding));
  }
  return findings;
}

std::vector<Finding> detect_control_chars(const ScanText &text) {
  std::vector<char32_t> order;
  std::unordered_map<char32_t, Occurrences> found;
  const auto &codepoints = text.codepoints();
  for (std::size_t i = 0; i < codepoints.size(); ++i) {
    const char32_t cp = codepoints[i];
    if (!is_control_char(cp)) {
      continue;
    }
    if (!found.contains(cp)) {
      order.push_back(cp);
    }
    found[cp].add(i);
  }

  std::vector<Finding> findings;
  findings.reserve(order.size());
  for (const char32_t cp : order) {
    findings.push_back(make_codepoint_finding(
        FindingType::ControlChar, cp,
        "Control character at codepoint " + std::to_string(static_cast<unsigned int>(cp)),
        Severity::High, std::move(found[cp])));
  }
  return findings;
}

std::vector<Finding> detect_tag_chars(const ScanText &text) {
  Occurrences occurrences;
  std::string hidden;
  std::size_t hidden_chars = 0;
  const auto &codepoints = text.codepoints();
  for (std::size_t i = 0; i < codepoints.size(); ++i) {
    const char32_t cp = codepoints[i];
    if (!is_tag_char(cp)) {
      continue;
    }
    occurrences.add(i);
    if (cp > kTagCharFirst && hidden_chars < kMaxHiddenContentChars) {
      hidden.push_back(static_cast<char>(cp - kTagCharFirst));
      ++hidden_chars;
    }
  }

  if (occurrences.count == 0) {
    return {};
  }

  Finding finding;
  finding.type = FindingType::AsciiSmuggling;
  finding.description = "Unicode tag characters detected (ASCII smuggling)";
  finding.severity = Severity::Critical;
  finding.count = occurrences.count;
  finding.positions = std::move(occurrences.positions);
  if (!hidden.empty()) {
    finding.hidden_content = std::move(hidden);
  }
  return {std::move(finding)};
}

std::vector<Finding> classify_codepoints(const ScanText &text) {
  std::vector<Finding> findings;
  for (auto *detect : {&detect_zero_width, &detect_bidi, &detect_homoglyphs,
                       &detect_control_chars, &detect_tag_chars}) {
    auto batch = detect(text);
    findings.insert(findings.end(), std::make_move_iterator(batch.begin()),
                    std::make_move_iterator(batch.end()));
  }
  return findings;
}

} // namespace textguard::engine

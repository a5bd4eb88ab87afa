#include "textguard/engine/payload_decoder.hpp"

#include "textguard/common/unicode.hpp"
#include "textguard/common/utf8.hpp"
#include "textguard/engine/patterns.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <set>
#include <utility>

namespace textguard::engine {

namespace {

constexpr std::size_t kLayerEncodedPreview = 50;
constexpr std::size_t kLayerDecodedPreview = 200;
constexpr std::size_t kFindingEncodedPreview = 60;
constexpr std::size_t kBase64DecodedPreview = 150;
constexpr std::size_t kNestedLayerPreview = 50;
constexpr std::size_t kHexDecodedPreview = 100;
constexpr std::size_t kRot13ContextRadius = 50;
constexpr std::size_t kRot13ContextChars = 100;
constexpr std::size_t kAlphabeticCandidateFloor = 30;

bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

bool is_ascii_alpha(const char ch) { return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z'); }

bool is_ascii_digit(const char ch) { return ch >= '0' && ch <= '9'; }

bool is_base64_char(const char ch) {
  return is_ascii_alpha(ch) || is_ascii_digit(ch) || ch == '+' || ch == '/';
}

bool is_base64url_char(const char ch) {
  return is_ascii_alpha(ch) || is_ascii_digit(ch) || ch == '_' || ch == '-';
}

int hex_value(const char ch) {
  if (is_ascii_digit(ch)) {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

std::string strip_whitespace(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (const char ch : value) {
    if (!is_ascii_space(ch)) {
      out.push_back(ch);
    }
  }
  return out;
}

std::string pad_base64(std::string value) {
  if (value.size() % 4 != 0) {
    value.append(4 - value.size() % 4, '=');
  }
  return value;
}

// Alphabet characters followed by at most two trailing `=`.
bool has_base64_shape(const std::string &padded) {
  std::size_t body = 0;
  while (body < padded.size() && is_base64_char(padded[body])) {
    ++body;
  }
  if (padded.size() - body > 2) {
    return false;
  }
  for (std::size_t i = body; i < padded.size(); ++i) {
    if (padded[i] != '=') {
      return false;
    }
  }
  return true;
}

std::string preview(const std::string &value, const std::size_t max_chars) {
  if (common::codepoint_length(value) > max_chars) {
    return common::utf8_prefix(value, max_chars) + "...";
  }
  return value;
}

struct Candidate {
  std::size_t start = 0;
  std::string value;
};

// Leftmost-longest runs of at least `min_length` alphabet characters followed
// by up to two `=`. Equivalent to searching `[alphabet]{min,}={0,2}`
// repeatedly, without regex backtracking over very long runs.
template <typename Alphabet>
std::vector<Candidate> find_base64_runs(const std::string &text, Alphabet in_alphabet,
                                        const std::size_t min_length) {
  std::vector<Candidate> runs;
  std::size_t i = 0;
  while (i < text.size()) {
    if (!in_alphabet(text[i])) {
      ++i;
      continue;
    }
    std::size_t end = i;
    while (end < text.size() && in_alphabet(text[end])) {
      ++end;
    }
    if (end - i < min_length) {
      i = end;
      continue;
    }
    std::size_t padding = 0;
    while (end < text.size() && text[end] == '=' && padding < 2) {
      ++end;
      ++padding;
    }
    runs.push_back(Candidate{i, text.substr(i, end - i)});
    i = end;
  }
  return runs;
}

bool is_alphabetic(const std::string &value) {
  return !value.empty() && std::all_of(value.begin(), value.end(), is_ascii_alpha);
}

std::vector<std::string> capped_threats(std::vector<std::string> threats) {
  if (threats.size() > kMaxReportedThreats) {
    threats.resize(kMaxReportedThreats);
  }
  return threats;
}

constexpr std::size_t kMinHexUnits = 8;
constexpr std::size_t kMinRawHexDigits = 16;

bool is_hex_digit(const char ch) { return hex_value(ch) >= 0; }

bool is_word_char(const char ch) { return is_ascii_alpha(ch) || is_ascii_digit(ch) || ch == '_'; }

enum class HexForm { ZeroX, Escaped, Percent, Raw };

struct HexShape {
  HexForm form;
  const char *description;
};

constexpr std::array<HexShape, 4> kHexShapes = {{
    {HexForm::ZeroX, "Hex with 0x prefix"},
    {HexForm::Escaped, "Hex with \\x prefix"},
    {HexForm::Percent, "URL-encoded hex"},
    {HexForm::Raw, "Raw hex string"},
}};

struct HexRun {
  std::size_t start = 0;
  std::size_t end = 0;
};

// Runs of at least kMinHexUnits `<prefix><two hex digits>` units, leftmost
// first and non-overlapping. With `separators`, spaces and commas may follow
// each unit and belong to the run.
std::vector<HexRun> find_prefixed_hex_runs(const std::string &text, const std::string &prefix,
                                           const bool separators) {
  std::vector<HexRun> runs;
  const std::size_t unit = prefix.size() + 2;
  auto at_unit = [&](const std::size_t pos) {
    return pos + unit <= text.size() && text.compare(pos, prefix.size(), prefix) == 0 &&
           is_hex_digit(text[pos + prefix.size()]) && is_hex_digit(text[pos + prefix.size() + 1]);
  };

  std::size_t start = text.find(prefix);
  while (start != std::string::npos) {
    std::size_t end = start;
    std::size_t units = 0;
    while (at_unit(end)) {
      end += unit;
      ++units;
      while (separators && end < text.size() && (is_ascii_space(text[end]) || text[end] == ',')) {
        ++end;
      }
    }
    if (units >= kMinHexUnits) {
      runs.push_back(HexRun{start, end});
      start = text.find(prefix, end);
    } else {
      start = text.find(prefix, start + 1);
    }
  }
  return runs;
}

// Whole words of at least kMinRawHexDigits hex digits.
std::vector<HexRun> find_raw_hex_runs(const std::string &text) {
  std::vector<HexRun> runs;
  std::size_t i = 0;
  while (i < text.size()) {
    if (!is_word_char(text[i])) {
      ++i;
      continue;
    }
    std::size_t end = i;
    bool all_hex = true;
    while (end < text.size() && is_word_char(text[end])) {
      all_hex = all_hex && is_hex_digit(text[end]);
      ++end;
    }
    if (all_hex && end - i >= kMinRawHexDigits) {
      runs.push_back(HexRun{i, end});
    }
    i = end;
  }
  return runs;
}

std::vector<HexRun> find_hex_runs(const std::string &text, const HexForm form) {
  switch (form) {
  case HexForm::ZeroX:
    return find_prefixed_hex_runs(text, "0x", true);
  case HexForm::Escaped:
    return find_prefixed_hex_runs(text, "\\x", false);
  case HexForm::Percent:
    return find_prefixed_hex_runs(text, "%", false);
  case HexForm::Raw:
    return find_raw_hex_runs(text);
  }
  return {};
}

struct Rot13Word {
  const char *encoded;
  const char *decoded;
};

constexpr std::array<Rot13Word, 10> kRot13Words = {{
    {"vtaber", "ignore"},
    {"flfgrz", "system"},
    {"cebzcg", "prompt"},
    {"vafgehpgvba", "instruction"},
    {"bireevqr", "override"},
    {"wnvyoernx", "jailbreak"},
    {"olcnff", "bypass"},
    {"qvfertneq", "disregard"},
    {"sbetrg", "forget"},
    {"cergraq", "pretend"},
}};

} // namespace

bool is_valid_base64(const std::string &candidate) {
  if (candidate.empty()) {
    return false;
  }
  const std::string padded = pad_base64(strip_whitespace(candidate));
  return has_base64_shape(padded) && padded.size() >= 8;
}

std::optional<std::string> base64_decode(const std::string &candidate) {
  const std::string padded = pad_base64(strip_whitespace(candidate));
  if (padded.empty()) {
    return std::string{};
  }
  if (!has_base64_shape(padded)) {
    return std::nullopt;
  }

  std::string out(padded.size() / 4 * 3, '\0');
  const int len = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                                  reinterpret_cast<const unsigned char *>(padded.data()),
                                  static_cast<int>(padded.size()));
  if (len < 0) {
    return std::nullopt;
  }

  // Padding decodes as zero bytes.
  std::size_t padding = 0;
  if (padded.back() == '=') {
    ++padding;
  }
  if (padded[padded.size() - 2] == '=') {
    ++padding;
  }
  out.resize(static_cast<std::size_t>(len) - padding);
  return out;
}

double printable_ratio(const std::u32string &decoded) {
  if (decoded.empty()) {
    return 0.0;
  }
  // Replacement characters stand for undecodable bytes and never count.
  const auto printable = std::count_if(decoded.begin(), decoded.end(), [](const char32_t cp) {
    return cp != common::kReplacementCharacter && common::is_printable_or_space(cp);
  });
  return static_cast<double>(printable) / static_cast<double>(decoded.size());
}

std::vector<DecodeLayer> decode_base64_recursive(const std::string &text,
                                                 const std::size_t max_depth) {
  std::vector<DecodeLayer> layers;
  std::string current = text;

  while (layers.size() < max_depth) {
    const std::string clean = strip_whitespace(current);
    if (!is_valid_base64(clean)) {
      break;
    }
    const std::string padded = pad_base64(clean);
    const auto bytes = base64_decode(padded);
    if (!bytes.has_value()) {
      break;
    }

    const std::u32string codepoints = common::decode_utf8(*bytes);
    if (printable_ratio(codepoints) < kMinPrintableRatio) {
      break;
    }

    DecodeLayer layer;
    layer.depth = layers.size() + 1;
    layer.encoded_preview = padded.size() > kLayerEncodedPreview
                                ? padded.substr(0, kLayerEncodedPreview) + "..."
                                : padded;
    layer.full_decoded = common::encode_utf8(codepoints);
    layer.decoded_preview = common::encode_utf8(codepoints, 0, kLayerDecodedPreview);
    current = layer.full_decoded;
    layers.push_back(std::move(layer));
  }

  return layers;
}

std::string hex_decode(const std::string &text) {
  std::string digits;
  digits.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (i + 1 < text.size() && (ch == '0' || ch == '\\') && text[i + 1] == 'x') {
      ++i;
      continue;
    }
    if (ch == '%' || is_ascii_space(ch) || ch == ',' || ch == ';' || ch == ':' || ch == '-') {
      continue;
    }
    digits.push_back(ch);
  }

  if (digits.empty() || digits.size() % 2 != 0) {
    return "";
  }

  std::string bytes;
  bytes.reserve(digits.size() / 2);
  for (std::size_t i = 0; i < digits.size(); i += 2) {
    const int high = hex_value(digits[i]);
    const int low = hex_value(digits[i + 1]);
    if (high < 0 || low < 0) {
      return "";
    }
    bytes.push_back(static_cast<char>((high << 4) | low));
  }
  return bytes;
}

std::string rot13(const std::string &text) {
  std::string out = text;
  for (auto &ch : out) {
    if (ch >= 'a' && ch <= 'z') {
      ch = static_cast<char>((ch - 'a' + 13) % 26 + 'a');
    } else if (ch >= 'A' && ch <= 'Z') {
      ch = static_cast<char>((ch - 'A' + 13) % 26 + 'A');
    }
  }
  return out;
}

std::vector<Finding> detect_base64_payloads(const ScanText &text) {
  std::vector<Finding> findings;
  std::set<std::size_t> claimed;

  const auto standard = find_base64_runs(text.utf8(), is_base64_char, kMinBase64Candidate);
  const auto url_safe = find_base64_runs(text.utf8(), is_base64url_char, kMinBase64Candidate);

  for (const auto *candidates : {&standard, &url_safe}) {
    for (const auto &candidate : *candidates) {
      if (claimed.contains(candidate.start)) {
        continue;
      }
      if (is_alphabetic(candidate.value) && candidate.value.size() < kAlphabeticCandidateFloor) {
        continue;
      }

      const auto layers = decode_base64_recursive(candidate.value);
      if (layers.empty()) {
        continue;
      }
      claimed.insert(candidate.start);

      std::string all_decoded;
      for (const auto &layer : layers) {
        if (!all_decoded.empty()) {
          all_decoded.push_back(' ');
        }
        all_decoded += layer.full_decoded;
      }
      auto threats = check_content_for_threats(all_decoded);

      Finding finding;
      finding.type = FindingType::EncodedPayload;
      finding.encoding = Encoding::Base64;
      const std::size_t depth = layers.size();
      if (depth >= 3) {
        finding.severity = Severity::Critical;
        finding.description = "Deeply nested base64 (" + std::to_string(depth) +
                              " layers) - possible evasion attempt";
      } else if (depth == 2) {
        finding.severity = Severity::High;
        finding.description = "Nested base64 (2 layers)";
      } else if (!threats.empty()) {
        finding.severity = Severity::High;
        finding.description = "Base64 encoded suspicious content";
      } else {
        finding.severity = Severity::Medium;
        finding.description = "Base64 encoded content detected";
      }

      finding.layers = depth;
      finding.encoded_preview = preview(candidate.value, kFindingEncodedPreview);
      const auto &deepest = layers.back();
      if (!deepest.decoded_preview.empty()) {
        finding.decoded_preview = common::utf8_prefix(deepest.decoded_preview, kBase64DecodedPreview);
      }
      finding.position = text.codepoint_offset(candidate.start);
      for (const auto &layer : layers) {
        finding.nested_layers.push_back(
            NestedLayer{layer.depth, common::utf8_prefix(layer.decoded_preview, kNestedLayerPreview)});
      }
      finding.threats_found = capped_threats(std::move(threats));
      findings.push_back(std::move(finding));
    }
  }

  return findings;
}

std::vector<Finding> detect_hex_payloads(const ScanText &text) {
  std::vector<Finding> findings;
  const std::string &subject = text.utf8();

  for (const auto &shape : kHexShapes) {
    for (const auto &run : find_hex_runs(subject, shape.form)) {
      const std::string encoded = subject.substr(run.start, run.end - run.start);
      const std::u32string decoded = common::decode_utf8(hex_decode(encoded));
      if (decoded.size() < kMinHexDecodedChars) {
        continue;
      }

      const std::string decoded_text = common::encode_utf8(decoded);
      auto threats = check_content_for_threats(decoded_text);

      Finding finding;
      finding.type = FindingType::EncodedPayload;
      finding.encoding = Encoding::Hex;
      finding.description = std::string(shape.description) + " - decoded to readable text";
      finding.severity = threats.empty() ? Severity::Medium : Severity::High;
      finding.encoded_preview = preview(encoded, kFindingEncodedPreview);
      finding.decoded_preview = common::encode_utf8(decoded, 0, kHexDecodedPreview);
      finding.position = text.codepoint_offset(run.start);
      finding.threats_found = capped_threats(std::move(threats));
      findings.push_back(std::move(finding));
    }
  }

  return findings;
}

std::vector<Finding> detect_rot13_payloads(const ScanText &text) {
  std::vector<Finding> findings;
  const auto &codepoints = text.codepoints();

  for (const auto &word : kRot13Words) {
    const std::string encoded = word.encoded;
    const auto byte_pos = text.folded().find(encoded);
    if (byte_pos == std::string::npos) {
      continue;
    }

    const std::size_t position = text.codepoint_offset(byte_pos);
    const std::size_t start = position > kRot13ContextRadius ? position - kRot13ContextRadius : 0;
    const std::size_t end =
        std::min(codepoints.size(), position + encoded.size() + kRot13ContextRadius);
    const std::string context = common::encode_utf8(codepoints, start, end - start);

    Finding finding;
    finding.type = FindingType::EncodedPayload;
    finding.encoding = Encoding::Rot13;
    finding.description = "ROT13 encoded suspicious word detected";
    finding.severity = Severity::High;
    finding.encoded_word = encoded;
    finding.decoded_word = word.decoded;
    finding.decoded_context = common::utf8_prefix(rot13(context), kRot13ContextChars);
    finding.position = position;
    findings.push_back(std::move(finding));
  }

  return findings;
}

} // namespace textguard::engine

#include "textguard/engine/finding.hpp"

namespace textguard::engine {

std::string_view to_string(const Severity severity) {
  switch (severity) {
  case Severity::Low:
    return "low";
  case Severity::Medium:
    return "medium";
  case Severity::High:
    return "high";
  case Severity::Critical:
    return "critical";
  }
  return "low";
}

std::string_view to_string(const ThreatLevel level) {
  switch (level) {
  case ThreatLevel::Safe:
    return "safe";
  case ThreatLevel::Low:
    return "low";
  case ThreatLevel::Medium:
    return "medium";
  case ThreatLevel::High:
    return "high";
  case ThreatLevel::Critical:
    return "critical";
  }
  return "safe";
}

std::string_view to_string(const FindingType type) {
  switch (type) {
  case FindingType::ZeroWidth:
    return "zero_width";
  case FindingType::BidiOverride:
    return "bidi_override";
  case FindingType::Homoglyph:
    return "homoglyph";
  case FindingType::ControlChar:
    return "control_char";
  case FindingType::AsciiSmuggling:
    return "ascii_smuggling";
  case FindingType::InstructionInjection:
    return "instruction_injection";
  case FindingType::EncodedPayload:
    return "encoded_payload";
  case FindingType::DelimiterInjection:
    return "delimiter_injection";
  }
  return "zero_width";
}

std::string_view to_string(const Encoding encoding) {
  switch (encoding) {
  case Encoding::Base64:
    return "base64";
  case Encoding::Hex:
    return "hex";
  case Encoding::Rot13:
    return "rot13";
  }
  return "base64";
}

std::optional<ThreatLevel> parse_threat_level(const std::string_view value) {
  if (value == "safe") {
    return ThreatLevel::Safe;
  }
  if (value == "low") {
    return ThreatLevel::Low;
  }
  if (value == "medium") {
    return ThreatLevel::Medium;
  }
  if (value == "high") {
    return ThreatLevel::High;
  }
  if (value == "critical") {
    return ThreatLevel::Critical;
  }
  return std::nullopt;
}

} // namespace textguard::engine

#include "textguard/engine/scanner.hpp"

#include "textguard/engine/classifier.hpp"
#include "textguard/engine/patterns.hpp"
#include "textguard/engine/payload_decoder.hpp"

#include <algorithm>
#include <iterator>

namespace textguard::engine {

ThreatScanner::ThreatScanner(const ScannerOptions options) {
  detectors_.push_back(std::make_unique<FunctionDetector>("zero_width", &detect_zero_width));
  detectors_.push_back(std::make_unique<FunctionDetector>("bidi", &detect_bidi));
  detectors_.push_back(std::make_unique<FunctionDetector>("homoglyph", &detect_homoglyphs));
  detectors_.push_back(std::make_unique<FunctionDetector>("control", &detect_control_chars));
  detectors_.push_back(std::make_unique<FunctionDetector>("tag", &detect_tag_chars));
  detectors_.push_back(
      std::make_unique<FunctionDetector>("instruction", &detect_instruction_patterns));
  detectors_.push_back(std::make_unique<FunctionDetector>("base64", &detect_base64_payloads));
  if (options.hex) {
    detectors_.push_back(std::make_unique<FunctionDetector>("hex", &detect_hex_payloads));
  }
  if (options.rot13) {
    detectors_.push_back(std::make_unique<FunctionDetector>("rot13", &detect_rot13_payloads));
  }
  detectors_.push_back(
      std::make_unique<FunctionDetector>("delimiter", &detect_delimiter_injection));
}

std::vector<Finding> ThreatScanner::scan(const ScanText &text) const {
  std::vector<Finding> findings;
  for (const auto &detector : detectors_) {
    auto batch = detector->detect(text);
    findings.insert(findings.end(), std::make_move_iterator(batch.begin()),
                    std::make_move_iterator(batch.end()));
  }
  return findings;
}

std::vector<std::string_view> ThreatScanner::detector_names() const {
  std::vector<std::string_view> names;
  names.reserve(detectors_.size());
  for (const auto &detector : detectors_) {
    names.push_back(detector->name());
  }
  return names;
}

ThreatLevel aggregate_threat_level(const std::vector<Finding> &findings) {
  if (findings.empty()) {
    return ThreatLevel::Safe;
  }

  const auto count_of = [&findings](const Severity severity) {
    return std::count_if(findings.begin(), findings.end(),
                         [severity](const Finding &f) { return f.severity == severity; });
  };

  if (count_of(Severity::Critical) > 0) {
    return ThreatLevel::Critical;
  }
  const auto high = count_of(Severity::High);
  if (high >= 2 || high > 0) {
    return ThreatLevel::High;
  }
  if (count_of(Severity::Medium) > 0) {
    return ThreatLevel::Medium;
  }
  return ThreatLevel::Low;
}

std::vector<SummaryEntry> summarize_findings(const std::vector<Finding> &findings) {
  std::vector<SummaryEntry> summary;
  for (const auto &finding : findings) {
    auto it = std::find_if(summary.begin(), summary.end(),
                           [&finding](const SummaryEntry &entry) { return entry.type == finding.type; });
    if (it == summary.end()) {
      summary.push_back(SummaryEntry{finding.type, 0, finding.severity});
      it = std::prev(summary.end());
    }
    it->count += finding.count.value_or(1);
    it->severity = finding.severity;
  }
  return summary;
}

} // namespace textguard::engine

#pragma once

#include "textguard/engine/finding.hpp"
#include "textguard/engine/scan_text.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace textguard::engine {

class IDetector {
public:
  virtual ~IDetector() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::vector<Finding> detect(const ScanText &text) const = 0;
};

using DetectFn = std::vector<Finding> (*)(const ScanText &);

/// Adapts one of the free detector functions to IDetector.
class FunctionDetector final : public IDetector {
public:
  FunctionDetector(std::string_view name, DetectFn fn) : name_(name), fn_(fn) {}

  [[nodiscard]] std::string_view name() const override { return name_; }
  [[nodiscard]] std::vector<Finding> detect(const ScanText &text) const override {
    return fn_(text);
  }

private:
  std::string_view name_;
  DetectFn fn_;
};

struct ScannerOptions {
  bool hex = false;
  bool rot13 = false;
};

/// Runs a fixed, ordered list of detectors over one text and concatenates
/// their findings. Order: zero-width, bidi, homoglyph, control, tag,
/// instruction patterns, base64, then hex and rot13 when enabled, then
/// delimiter patterns.
class ThreatScanner {
public:
  explicit ThreatScanner(ScannerOptions options = {});

  [[nodiscard]] std::vector<Finding> scan(const ScanText &text) const;
  [[nodiscard]] std::vector<std::string_view> detector_names() const;

private:
  std::vector<std::unique_ptr<IDetector>> detectors_;
};

struct SummaryEntry {
  FindingType type = FindingType::ZeroWidth;
  std::size_t count = 0;
  Severity severity = Severity::Low;
};

/// safe when empty; otherwise the highest severity present, with low as the
/// floor.
[[nodiscard]] ThreatLevel aggregate_threat_level(const std::vector<Finding> &findings);

/// Per finding type, in first-seen order: summed counts (a finding without a
/// count adds one) and the severity of the last finding of that type.
[[nodiscard]] std::vector<SummaryEntry> summarize_findings(const std::vector<Finding> &findings);

} // namespace textguard::engine

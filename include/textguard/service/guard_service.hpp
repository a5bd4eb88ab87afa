#pragma once

#include "textguard/common/result.hpp"
#include "textguard/config/schema.hpp"
#include "textguard/engine/finding.hpp"
#include "textguard/engine/sanitizer.hpp"
#include "textguard/engine/scanner.hpp"
#include "textguard/engine/techniques.hpp"
#include "textguard/history/scan_log.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace textguard::service {

struct ScanResult {
  std::string id;
  std::string timestamp;
  std::size_t original_text_length = 0;
  engine::ThreatLevel threat_level = engine::ThreatLevel::Safe;
  std::size_t total_findings = 0;
  std::vector<engine::Finding> findings;
  std::vector<engine::SummaryEntry> summary;
};

struct CleanResult {
  std::string id;
  std::string timestamp;
  std::size_t original_length = 0;
  std::size_t cleaned_length = 0;
  std::string cleaned_text;
  std::int64_t characters_removed = 0;
  std::vector<engine::RemovedDetail> removed_details;
  engine::ThreatLevel threat_level_before = engine::ThreatLevel::Safe;
};

struct GuardOptions {
  std::size_t max_input_chars = 100'000;
  std::size_t default_history_limit = 20;
  engine::ScannerOptions scanner;
};

[[nodiscard]] GuardOptions guard_options_from_config(const config::Config &config);

/// Facade over the engine and the scan log. Validates input length before
/// anything reaches the engine; only `scan` writes to the log.
class GuardService {
public:
  GuardService(GuardOptions options, std::unique_ptr<history::IScanLog> scan_log);

  [[nodiscard]] common::Result<ScanResult> scan(const std::string &text);
  [[nodiscard]] common::Result<CleanResult> clean(const std::string &text);
  [[nodiscard]] common::Result<std::vector<history::ScanHistoryEntry>>
  list_history(std::size_t limit);
  [[nodiscard]] common::Result<std::vector<history::ScanHistoryEntry>> list_history();
  [[nodiscard]] const std::vector<engine::TechniqueInfo> &list_techniques() const;
  [[nodiscard]] common::Result<std::size_t> clear_history();

  [[nodiscard]] const GuardOptions &options() const { return options_; }
  [[nodiscard]] history::IScanLog &scan_log() { return *scan_log_; }

private:
  [[nodiscard]] common::Status validate_input(const std::string &text) const;

  GuardOptions options_;
  engine::ThreatScanner scanner_;
  std::unique_ptr<history::IScanLog> scan_log_;
};

/// Builds the scan log named by the config and wraps it in a service.
[[nodiscard]] common::Result<std::unique_ptr<GuardService>>
create_guard_service(const config::Config &config);

} // namespace textguard::service

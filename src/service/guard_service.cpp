#include "textguard/service/guard_service.hpp"

#include "textguard/common/ids.hpp"
#include "textguard/common/utf8.hpp"
#include "textguard/engine/classifier.hpp"
#include "textguard/engine/scan_text.hpp"
#include "textguard/history/noop_scan_log.hpp"
#include "textguard/observability/global.hpp"
#include "textguard/service/render.hpp"

#include <chrono>
#include <utility>

namespace textguard::service {

namespace {

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

} // namespace

GuardOptions guard_options_from_config(const config::Config &config) {
  GuardOptions options;
  options.max_input_chars = static_cast<std::size_t>(config.scan.max_input_chars);
  options.default_history_limit = static_cast<std::size_t>(config.history.default_limit);
  options.scanner.hex = config.detectors.hex;
  options.scanner.rot13 = config.detectors.rot13;
  return options;
}

GuardService::GuardService(GuardOptions options, std::unique_ptr<history::IScanLog> scan_log)
    : options_(std::move(options)), scanner_(options_.scanner), scan_log_(std::move(scan_log)) {
  if (!scan_log_) {
    scan_log_ = std::make_unique<history::NoopScanLog>();
  }
}

common::Status GuardService::validate_input(const std::string &text) const {
  if (!common::is_valid_utf8(text)) {
    return common::Status::error("text must be valid UTF-8");
  }
  const std::size_t length = common::codepoint_length(text);
  if (length < 1) {
    return common::Status::error("text must be at least 1 character");
  }
  if (length > options_.max_input_chars) {
    return common::Status::error("text must be at most " +
                                 std::to_string(options_.max_input_chars) + " characters");
  }
  return common::Status::success();
}

common::Result<ScanResult> GuardService::scan(const std::string &text) {
  const auto status = validate_input(text);
  if (!status.ok()) {
    return common::Result<ScanResult>::failure(status.error());
  }
  auto id = common::generate_uuid_v4();
  if (!id.ok()) {
    return common::Result<ScanResult>::failure(id.error());
  }

  const auto start = std::chrono::steady_clock::now();
  const engine::ScanText scan_text(text);

  ScanResult result;
  result.id = id.value();
  result.timestamp = common::now_rfc3339();
  result.original_text_length = scan_text.length();
  result.findings = scanner_.scan(scan_text);
  result.threat_level = engine::aggregate_threat_level(result.findings);
  result.total_findings = result.findings.size();
  result.summary = engine::summarize_findings(result.findings);

  history::ScanRecord record;
  record.entry.id = result.id;
  record.entry.timestamp = result.timestamp;
  record.entry.original_text_preview = history::make_preview(text);
  record.entry.threat_level = std::string(engine::to_string(result.threat_level));
  record.entry.total_findings = result.total_findings;
  record.findings_json = render_findings(result.findings);
  record.summary_json = render_summary(result.summary);

  const auto logged = scan_log_->append(record);
  if (!logged.ok()) {
    observability::record_error("history", "failed to record scan " + result.id + ": " +
                                               logged.error());
  }

  observability::record_scan_completed(record.entry.threat_level, result.total_findings,
                                       result.original_text_length, elapsed_since(start));
  return common::Result<ScanResult>::success(std::move(result));
}

common::Result<CleanResult> GuardService::clean(const std::string &text) {
  const auto status = validate_input(text);
  if (!status.ok()) {
    return common::Result<CleanResult>::failure(status.error());
  }
  auto id = common::generate_uuid_v4();
  if (!id.ok()) {
    return common::Result<CleanResult>::failure(id.error());
  }

  const auto start = std::chrono::steady_clock::now();
  const engine::ScanText scan_text(text);
  const auto before = engine::classify_codepoints(scan_text);

  auto outcome = engine::sanitize_text(text);
  if (!outcome.ok()) {
    observability::record_error("sanitizer", outcome.error());
    return common::Result<CleanResult>::failure(outcome.error());
  }

  CleanResult result;
  result.id = id.value();
  result.timestamp = common::now_rfc3339();
  result.original_length = outcome.value().original_length;
  result.cleaned_length = outcome.value().cleaned_length;
  result.cleaned_text = std::move(outcome.value().cleaned_text);
  result.characters_removed = outcome.value().characters_removed;
  result.removed_details = std::move(outcome.value().removed_details);
  result.threat_level_before = engine::aggregate_threat_level(before);

  observability::record_clean_completed(result.characters_removed, elapsed_since(start));
  return common::Result<CleanResult>::success(std::move(result));
}

common::Result<std::vector<history::ScanHistoryEntry>>
GuardService::list_history(const std::size_t limit) {
  if (limit == 0) {
    return common::Result<std::vector<history::ScanHistoryEntry>>::failure(
        "limit must be at least 1");
  }
  return scan_log_->list(limit);
}

common::Result<std::vector<history::ScanHistoryEntry>> GuardService::list_history() {
  return list_history(options_.default_history_limit);
}

const std::vector<engine::TechniqueInfo> &GuardService::list_techniques() const {
  return engine::technique_catalog();
}

common::Result<std::size_t> GuardService::clear_history() {
  auto deleted = scan_log_->clear();
  if (!deleted.ok()) {
    observability::record_error("history", deleted.error());
    return deleted;
  }
  observability::record_history_cleared(deleted.value());
  return deleted;
}

common::Result<std::unique_ptr<GuardService>> create_guard_service(const config::Config &config) {
  auto scan_log = history::create_scan_log(config);
  if (!scan_log.ok()) {
    return common::Result<std::unique_ptr<GuardService>>::failure(scan_log.error());
  }
  return common::Result<std::unique_ptr<GuardService>>::success(std::make_unique<GuardService>(
      guard_options_from_config(config), std::move(scan_log.value())));
}

} // namespace textguard::service

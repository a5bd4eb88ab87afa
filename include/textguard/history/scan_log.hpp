#pragma once

#include "textguard/common/result.hpp"
#include "textguard/config/schema.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace textguard::history {

inline constexpr std::size_t kPreviewChars = 100;

struct ScanHistoryEntry {
  std::string id;
  std::string timestamp;
  std::string original_text_preview;
  std::string threat_level;
  std::size_t total_findings = 0;
};

/// A history entry plus the rendered findings list and summary object.
struct ScanRecord {
  ScanHistoryEntry entry;
  std::string findings_json = "[]";
  std::string summary_json = "{}";
};

class IScanLog {
public:
  virtual ~IScanLog() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Status append(const ScanRecord &record) = 0;
  /// Most recent first.
  [[nodiscard]] virtual common::Result<std::vector<ScanHistoryEntry>> list(std::size_t limit) = 0;
  /// Removes every record and returns how many there were.
  [[nodiscard]] virtual common::Result<std::size_t> clear() = 0;
  [[nodiscard]] virtual common::Result<std::size_t> count() = 0;
  [[nodiscard]] virtual bool health_check() = 0;
};

/// First kPreviewChars codepoints of the text, with `...` appended when cut.
[[nodiscard]] std::string make_preview(const std::string &text);

/// `sqlite` opens the configured database; `none` returns a log that keeps
/// nothing.
[[nodiscard]] common::Result<std::unique_ptr<IScanLog>> create_scan_log(const config::Config &config);

} // namespace textguard::history

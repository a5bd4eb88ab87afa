#pragma once

#include "textguard/engine/finding.hpp"
#include "textguard/engine/scanner.hpp"
#include "textguard/engine/techniques.hpp"
#include "textguard/history/scan_log.hpp"
#include "textguard/service/guard_service.hpp"

#include <string>
#include <vector>

namespace textguard::service {

/// Compact JSON. Optional finding fields are written only when present.
[[nodiscard]] std::string render_finding(const engine::Finding &finding);
[[nodiscard]] std::string render_findings(const std::vector<engine::Finding> &findings);

/// Object keyed by finding type: `{"zero_width":{"count":2,"severity":"high"}}`.
[[nodiscard]] std::string render_summary(const std::vector<engine::SummaryEntry> &summary);

[[nodiscard]] std::string render_scan_result(const ScanResult &result);
[[nodiscard]] std::string render_clean_result(const CleanResult &result);
[[nodiscard]] std::string render_history(const std::vector<history::ScanHistoryEntry> &entries);
[[nodiscard]] std::string render_techniques(const std::vector<engine::TechniqueInfo> &techniques);

} // namespace textguard::service

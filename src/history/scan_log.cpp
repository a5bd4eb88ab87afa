#include "textguard/history/scan_log.hpp"

#include "textguard/common/fs.hpp"
#include "textguard/common/utf8.hpp"
#include "textguard/config/config.hpp"
#include "textguard/history/noop_scan_log.hpp"
#include "textguard/history/sqlite_scan_log.hpp"

namespace textguard::history {

std::string make_preview(const std::string &text) {
  if (common::codepoint_length(text) <= kPreviewChars) {
    return text;
  }
  return common::utf8_prefix(text, kPreviewChars) + "...";
}

common::Result<std::unique_ptr<IScanLog>> create_scan_log(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.history.backend));
  if (backend == "none") {
    return common::Result<std::unique_ptr<IScanLog>>::success(std::make_unique<NoopScanLog>());
  }
  if (backend != "sqlite") {
    return common::Result<std::unique_ptr<IScanLog>>::failure("unknown history backend: " +
                                                              config.history.backend);
  }

  auto log = std::make_unique<SqliteScanLog>(config::history_db_path(config));
  if (!log->open_error().empty()) {
    return common::Result<std::unique_ptr<IScanLog>>::failure(
        "failed to open scan history at " + config::history_db_path(config).string() + ": " +
        log->open_error());
  }
  return common::Result<std::unique_ptr<IScanLog>>::success(std::move(log));
}

} // namespace textguard::history

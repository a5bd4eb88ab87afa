#pragma once

#include "textguard/history/scan_log.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <mutex>

namespace textguard::history {

class SqliteScanLog final : public IScanLog {
public:
  explicit SqliteScanLog(std::filesystem::path db_path);
  ~SqliteScanLog() override;

  SqliteScanLog(const SqliteScanLog &) = delete;
  SqliteScanLog &operator=(const SqliteScanLog &) = delete;

  [[nodiscard]] std::string_view name() const override { return "sqlite"; }
  [[nodiscard]] common::Status append(const ScanRecord &record) override;
  [[nodiscard]] common::Result<std::vector<ScanHistoryEntry>> list(std::size_t limit) override;
  [[nodiscard]] common::Result<std::size_t> clear() override;
  [[nodiscard]] common::Result<std::size_t> count() override;
  [[nodiscard]] bool health_check() override;

  /// Empty when the database opened and the schema is in place.
  [[nodiscard]] const std::string &open_error() const { return open_error_; }

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<std::size_t> count_locked();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
  std::string open_error_;
};

} // namespace textguard::history

#include "textguard/history/sqlite_scan_log.hpp"

#include <system_error>
#include <utility>

namespace textguard::history {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string{} : reinterpret_cast<const char *>(text);
}

} // namespace

SqliteScanLog::SqliteScanLog(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_error_ = db_ == nullptr ? "failed to open scan history database"
                                 : std::string(sqlite3_errmsg(db_));
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }

  const auto status = init_schema();
  if (!status.ok()) {
    open_error_ = status.error();
  }
}

SqliteScanLog::~SqliteScanLog() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteScanLog::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error("database is not initialized");
  }

  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS scan_history (
  id TEXT PRIMARY KEY,
  timestamp TEXT NOT NULL,
  preview TEXT NOT NULL,
  threat_level TEXT NOT NULL,
  total_findings INTEGER NOT NULL,
  findings_json TEXT NOT NULL,
  summary_json TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_scan_history_timestamp ON scan_history(timestamp);
)");
}

common::Status SqliteScanLog::append(const ScanRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr || !open_error_.empty()) {
    return common::Status::error(open_error_.empty() ? "database is not initialized"
                                                     : open_error_);
  }

  const char *sql = "INSERT INTO scan_history(id, timestamp, preview, threat_level, "
                    "total_findings, findings_json, summary_json) VALUES(?, ?, ?, ?, ?, ?, ?)";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  const auto &entry = record.entry;
  sqlite3_bind_text(stmt, 1, entry.id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, entry.timestamp.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, entry.original_text_preview.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, entry.threat_level.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(entry.total_findings));
  sqlite3_bind_text(stmt, 6, record.findings_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 7, record.summary_json.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<std::vector<ScanHistoryEntry>> SqliteScanLog::list(const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr || !open_error_.empty()) {
    return common::Result<std::vector<ScanHistoryEntry>>::failure(
        open_error_.empty() ? "database is not initialized" : open_error_);
  }

  const char *sql = "SELECT id, timestamp, preview, threat_level, total_findings "
                    "FROM scan_history ORDER BY timestamp DESC, rowid DESC LIMIT ?";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<ScanHistoryEntry>>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));

  std::vector<ScanHistoryEntry> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    ScanHistoryEntry entry;
    entry.id = column_text(stmt, 0);
    entry.timestamp = column_text(stmt, 1);
    entry.original_text_preview = column_text(stmt, 2);
    entry.threat_level = column_text(stmt, 3);
    entry.total_findings = static_cast<std::size_t>(sqlite3_column_int64(stmt, 4));
    out.push_back(std::move(entry));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<ScanHistoryEntry>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<ScanHistoryEntry>>::success(std::move(out));
}

common::Result<std::size_t> SqliteScanLog::count_locked() {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM scan_history", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  std::size_t total = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(total);
}

common::Result<std::size_t> SqliteScanLog::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr || !open_error_.empty()) {
    return common::Result<std::size_t>::failure(open_error_.empty() ? "database is not initialized"
                                                                    : open_error_);
  }
  return count_locked();
}

common::Result<std::size_t> SqliteScanLog::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr || !open_error_.empty()) {
    return common::Result<std::size_t>::failure(open_error_.empty() ? "database is not initialized"
                                                                    : open_error_);
  }

  auto existing = count_locked();
  if (!existing.ok()) {
    return existing;
  }
  const auto status = exec_sql(db_, "DELETE FROM scan_history;");
  if (!status.ok()) {
    return common::Result<std::size_t>::failure(status.error());
  }
  return existing;
}

bool SqliteScanLog::health_check() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr || !open_error_.empty()) {
    return false;
  }
  return exec_sql(db_, "SELECT 1;").ok();
}

} // namespace textguard::history

#pragma once

#include "textguard/history/scan_log.hpp"

namespace textguard::history {

class NoopScanLog final : public IScanLog {
public:
  [[nodiscard]] std::string_view name() const override { return "none"; }
  [[nodiscard]] common::Status append(const ScanRecord &) override {
    return common::Status::success();
  }
  [[nodiscard]] common::Result<std::vector<ScanHistoryEntry>> list(std::size_t) override {
    return common::Result<std::vector<ScanHistoryEntry>>::success({});
  }
  [[nodiscard]] common::Result<std::size_t> clear() override {
    return common::Result<std::size_t>::success(0);
  }
  [[nodiscard]] common::Result<std::size_t> count() override {
    return common::Result<std::size_t>::success(0);
  }
  [[nodiscard]] bool health_check() override { return true; }
};

} // namespace textguard::history

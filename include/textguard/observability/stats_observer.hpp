#pragma once

#include "textguard/observability/observer.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <ostream>
#include <string>

namespace textguard::observability {

/// Tallies scans per threat level and cleaning totals for one process run.
/// flush() writes a single `[INFO] session ...` line and starts a new tally;
/// nothing is written when nothing was recorded.
class StatsObserver final : public IObserver {
public:
  explicit StatsObserver(std::ostream &out = std::cerr) : out_(out) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "stats"; }

private:
  std::ostream &out_;
  std::map<std::string, std::uint64_t> scans_by_level_;
  std::uint64_t scans_ = 0;
  std::uint64_t findings_ = 0;
  std::uint64_t cleans_ = 0;
  std::int64_t characters_removed_ = 0;
  std::uint64_t errors_ = 0;
  std::chrono::milliseconds busy_{0};
};

} // namespace textguard::observability

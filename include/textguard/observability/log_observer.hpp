#pragma once

#include "textguard/observability/observer.hpp"

#include <iostream>
#include <ostream>

namespace textguard::observability {

/// Writes one `[LEVEL] message` line per event or metric.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(std::ostream &out = std::cerr) : out_(out) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override { out_.flush(); }
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  std::ostream &out_;
};

} // namespace textguard::observability

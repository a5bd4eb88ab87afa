#pragma once

#include "textguard/observability/observer.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace textguard::observability {

/// Fans events out to several backends. Holds at most one observer per
/// name(): `log,log` writes each line once.
class MultiObserver final : public IObserver {
public:
  /// False when `observer` is null or a backend of the same name is present.
  bool add(std::unique_ptr<IObserver> observer);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }
  [[nodiscard]] std::size_t size() const { return observers_.size(); }
  [[nodiscard]] std::vector<std::string_view> backend_names() const;

  /// Hands back the only child when there is exactly one.
  [[nodiscard]] std::unique_ptr<IObserver> release_single();

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace textguard::observability

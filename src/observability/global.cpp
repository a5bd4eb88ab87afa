#include "textguard/observability/global.hpp"

#include <mutex>

namespace textguard::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_scan_completed(const std::string &threat_level, const std::uint64_t findings,
                           const std::uint64_t input_chars,
                           const std::chrono::milliseconds duration) {
  record_event(ScanCompletedEvent{.threat_level = threat_level,
                                  .findings = findings,
                                  .input_chars = input_chars,
                                  .duration = duration});
  record_metric(ScanLatencyMetric{.latency = duration});
  record_metric(FindingsMetric{.count = findings});
}

void record_clean_completed(const std::int64_t characters_removed,
                            const std::chrono::milliseconds duration) {
  record_event(
      CleanCompletedEvent{.characters_removed = characters_removed, .duration = duration});
}

void record_history_cleared(const std::uint64_t deleted) {
  record_event(HistoryClearedEvent{.deleted = deleted});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace textguard::observability

#include "textguard/observability/log_observer.hpp"

#include <type_traits>

namespace textguard::observability {

namespace {

void log_line(std::ostream &out, const std::string &level, const std::string &message) {
  out << "[" << level << "] " << message << "\n";
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ScanCompletedEvent>) {
          log_line(out_, "INFO",
                   "scan.completed threat_level=" + evt.threat_level +
                       " findings=" + std::to_string(evt.findings) +
                       " input_chars=" + std::to_string(evt.input_chars) +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, CleanCompletedEvent>) {
          log_line(out_, "INFO",
                   "clean.completed characters_removed=" +
                       std::to_string(evt.characters_removed) +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, HistoryClearedEvent>) {
          log_line(out_, "INFO", "history.cleared deleted=" + std::to_string(evt.deleted));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(out_, "ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ScanLatencyMetric>) {
          log_line(out_, "DEBUG", "metric.scan_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, FindingsMetric>) {
          log_line(out_, "DEBUG", "metric.findings=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace textguard::observability

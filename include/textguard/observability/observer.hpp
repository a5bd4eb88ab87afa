#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace textguard::observability {

struct ScanCompletedEvent {
  std::string threat_level;
  std::uint64_t findings = 0;
  std::uint64_t input_chars = 0;
  std::chrono::milliseconds duration{0};
};

struct CleanCompletedEvent {
  std::int64_t characters_removed = 0;
  std::chrono::milliseconds duration{0};
};

struct HistoryClearedEvent {
  std::uint64_t deleted = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ScanCompletedEvent, CleanCompletedEvent, HistoryClearedEvent, ErrorEvent>;

struct ScanLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct FindingsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<ScanLatencyMetric, FindingsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace textguard::observability

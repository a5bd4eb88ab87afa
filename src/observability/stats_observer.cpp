#include "textguard/observability/stats_observer.hpp"

#include <sstream>
#include <type_traits>

namespace textguard::observability {

void StatsObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ScanCompletedEvent>) {
          ++scans_;
          ++scans_by_level_[evt.threat_level];
          findings_ += evt.findings;
          busy_ += evt.duration;
        } else if constexpr (std::is_same_v<T, CleanCompletedEvent>) {
          ++cleans_;
          characters_removed_ += evt.characters_removed;
          busy_ += evt.duration;
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          ++errors_;
        }
      },
      event);
}

// Findings and latency arrive as events too.
void StatsObserver::record_metric(const ObserverMetric &) {}

void StatsObserver::flush() {
  if (scans_ == 0 && cleans_ == 0 && errors_ == 0) {
    out_.flush();
    return;
  }

  std::ostringstream line;
  line << "[INFO] session scans=" << scans_ << " findings=" << findings_ << " cleans=" << cleans_
       << " characters_removed=" << characters_removed_ << " errors=" << errors_
       << " busy_ms=" << busy_.count();
  if (!scans_by_level_.empty()) {
    line << " levels=";
    bool first = true;
    for (const auto &[level, count] : scans_by_level_) {
      line << (first ? "" : ",") << level << ":" << count;
      first = false;
    }
  }
  out_ << line.str() << "\n";
  out_.flush();

  scans_by_level_.clear();
  scans_ = 0;
  findings_ = 0;
  cleans_ = 0;
  characters_removed_ = 0;
  errors_ = 0;
  busy_ = std::chrono::milliseconds{0};
}

} // namespace textguard::observability

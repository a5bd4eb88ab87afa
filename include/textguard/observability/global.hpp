#pragma once

#include "textguard/observability/observer.hpp"

#include <memory>

namespace textguard::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_scan_completed(const std::string &threat_level, std::uint64_t findings,
                           std::uint64_t input_chars, std::chrono::milliseconds duration);
void record_clean_completed(std::int64_t characters_removed, std::chrono::milliseconds duration);
void record_history_cleared(std::uint64_t deleted);
void record_error(const std::string &component, const std::string &message);

} // namespace textguard::observability

#include "textguard/observability/multi_observer.hpp"

#include <algorithm>

namespace textguard::observability {

bool MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return false;
  }
  const auto duplicate = std::any_of(observers_.begin(), observers_.end(), [&](const auto &child) {
    return child->name() == observer->name();
  });
  if (duplicate) {
    return false;
  }
  observers_.push_back(std::move(observer));
  return true;
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (auto &observer : observers_) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (auto &observer : observers_) {
    observer->flush();
  }
}

std::vector<std::string_view> MultiObserver::backend_names() const {
  std::vector<std::string_view> names;
  names.reserve(observers_.size());
  for (const auto &observer : observers_) {
    names.push_back(observer->name());
  }
  return names;
}

std::unique_ptr<IObserver> MultiObserver::release_single() {
  if (observers_.size() != 1) {
    return nullptr;
  }
  auto only = std::move(observers_.front());
  observers_.clear();
  return only;
}

} // namespace textguard::observability

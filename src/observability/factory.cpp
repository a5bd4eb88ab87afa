#include "textguard/observability/factory.hpp"

#include "textguard/common/fs.hpp"
#include "textguard/observability/log_observer.hpp"
#include "textguard/observability/multi_observer.hpp"
#include "textguard/observability/noop_observer.hpp"
#include "textguard/observability/stats_observer.hpp"

#include <sstream>

namespace textguard::observability {

namespace {

// `none`, `noop` and names validate_config rejects have no backend.
std::unique_ptr<IObserver> make_backend(const std::string &name) {
  if (name == "log") {
    return std::make_unique<LogObserver>();
  }
  if (name == "stats") {
    return std::make_unique<StatsObserver>();
  }
  return nullptr;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  auto fanout = std::make_unique<MultiObserver>();
  std::stringstream stream(common::to_lower(config.observability.backend));
  std::string part;
  while (std::getline(stream, part, ',')) {
    fanout->add(make_backend(common::trim(part)));
  }

  if (fanout->size() == 0) {
    return std::make_unique<NoopObserver>();
  }
  if (fanout->size() == 1) {
    return fanout->release_single();
  }
  return fanout;
}

} // namespace textguard::observability

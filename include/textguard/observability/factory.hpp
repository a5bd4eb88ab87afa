#pragma once

#include "textguard/config/schema.hpp"
#include "textguard/observability/observer.hpp"

#include <memory>

namespace textguard::observability {

/// Builds the observer named by `observability.backend`, a comma list of
/// `log`, `stats` and `none`. Repeated names collapse to one backend; a
/// single backend is returned bare and an empty list gives a NoopObserver.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace textguard::observability

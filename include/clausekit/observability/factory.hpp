#pragma once

#include "clausekit/config/schema.hpp"
#include "clausekit/observability/observer.hpp"

#include <memory>

namespace clausekit::observability {

/// Sink named by observability.backend: "log", "stderr", "stdout", "none", or a
/// comma-separated list of them.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace clausekit::observability

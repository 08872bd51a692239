#include "clausekit/observability/factory.hpp"

#include "clausekit/common/fs.hpp"
#include "clausekit/observability/log_observer.hpp"
#include "clausekit/observability/multi_observer.hpp"
#include "clausekit/observability/noop_observer.hpp"

#include <iostream>
#include <sstream>
#include <vector>

namespace clausekit::observability {

namespace {

std::vector<std::string> backend_list(const std::string &raw) {
  std::vector<std::string> backends;
  std::stringstream stream(raw);
  std::string part;
  while (std::getline(stream, part, ',')) {
    part = common::to_lower(common::trim(part));
    if (!part.empty() && part != "none" && part != "noop") {
      backends.push_back(part);
    }
  }
  return backends;
}

// "stdout" logs to standard output; "log", "stderr" and unknown names log to
// standard error.
std::unique_ptr<IObserver> create_backend(const std::string &backend) {
  if (backend == "stdout") {
    return std::make_unique<LogObserver>(std::cout);
  }
  return std::make_unique<LogObserver>(std::cerr);
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const auto backends = backend_list(config.observability.backend);
  if (backends.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (backends.size() == 1) {
    return create_backend(backends.front());
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &backend : backends) {
    multi->add(create_backend(backend));
  }
  return multi;
}

} // namespace clausekit::observability

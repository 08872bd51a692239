#pragma once

#include "clausekit/observability/observer.hpp"

namespace clausekit::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "none"; }
};

} // namespace clausekit::observability

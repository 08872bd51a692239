#pragma once

#include "clausekit/observability/observer.hpp"

#include <iostream>
#include <mutex>

namespace clausekit::observability {

/// Writes one `[LEVEL] message` line per event or metric.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(std::ostream &out = std::cerr) : out_(out) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(std::string_view level, const std::string &message);

  std::ostream &out_;
  std::mutex mutex_;
};

} // namespace clausekit::observability

#pragma once

#include "clausekit/observability/observer.hpp"

#include <memory>
#include <shared_mutex>
#include <vector>

namespace clausekit::observability {

/// Forwards every event and metric to each child in insertion order. Children
/// may be added while other threads are recording.
class MultiObserver final : public IObserver {
public:
  MultiObserver() = default;
  explicit MultiObserver(std::vector<std::unique_ptr<IObserver>> observers);

  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const;

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  mutable std::shared_mutex mutex_;
  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace clausekit::observability

#include "clausekit/observability/multi_observer.hpp"

#include <algorithm>
#include <mutex>

namespace clausekit::observability {

MultiObserver::MultiObserver(std::vector<std::unique_ptr<IObserver>> observers) {
  for (auto &observer : observers) {
    add(std::move(observer));
  }
}

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return;
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  observers_.push_back(std::move(observer));
}

std::size_t MultiObserver::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return observers_.size();
}

void MultiObserver::record_event(const ObserverEvent &event) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::for_each(observers_.begin(), observers_.end(),
                [&event](const auto &observer) { observer->record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::for_each(observers_.begin(), observers_.end(),
                [&metric](const auto &observer) { observer->record_metric(metric); });
}

void MultiObserver::flush() {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  for (const auto &observer : observers_) {
    observer->flush();
  }
}

} // namespace clausekit::observability

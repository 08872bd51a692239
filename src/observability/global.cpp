#include "clausekit/observability/global.hpp"

#include <mutex>

namespace clausekit::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_pipeline_start(const std::size_t elements, const std::string &classifier,
                           const std::string &strategy) {
  record_event(
      PipelineStartEvent{.elements = elements, .classifier = classifier, .strategy = strategy});
}

void record_pipeline_end(const std::chrono::milliseconds duration, const std::size_t sections,
                         const std::size_t chunks) {
  record_event(PipelineEndEvent{.duration = duration, .sections = sections, .chunks = chunks});
}

void record_split_fallback(const std::size_t size, const std::size_t max_size) {
  record_event(SplitFallbackEvent{.size = size, .max_size = max_size});
}

void record_classifier_fallback(const std::string &backend, const std::string &reason,
                                const std::size_t texts) {
  record_event(ClassifierFallbackEvent{.backend = backend, .reason = reason, .texts = texts});
}

void record_config_warning(const std::string &key, const std::string &message) {
  record_event(ConfigWarningEvent{.key = key, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace clausekit::observability

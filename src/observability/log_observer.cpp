#include "clausekit/observability/log_observer.hpp"

#include <type_traits>

namespace clausekit::observability {

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, PipelineStartEvent>) {
          log_line("INFO", "pipeline.start elements=" + std::to_string(evt.elements) +
                               " classifier=" + evt.classifier + " strategy=" + evt.strategy);
        } else if constexpr (std::is_same_v<T, PipelineEndEvent>) {
          log_line("INFO", "pipeline.end duration_ms=" + std::to_string(evt.duration.count()) +
                               " sections=" + std::to_string(evt.sections) +
                               " chunks=" + std::to_string(evt.chunks));
        } else if constexpr (std::is_same_v<T, SplitFallbackEvent>) {
          log_line("WARN", "split.oversized_sentence size=" + std::to_string(evt.size) +
                               " max_size=" + std::to_string(evt.max_size));
        } else if constexpr (std::is_same_v<T, ClassifierFallbackEvent>) {
          log_line("WARN", "classifier.fallback backend=" + evt.backend +
                               " texts=" + std::to_string(evt.texts) + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, ConfigWarningEvent>) {
          log_line("WARN", "config " + evt.key + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ChunksEmittedMetric>) {
          log_line("DEBUG", "metric.chunks_emitted=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, DuplicatesDroppedMetric>) {
          log_line("DEBUG", "metric.duplicates_dropped=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, ClassifierLatencyMetric>) {
          log_line("DEBUG", "metric.classifier_latency_ms=" + std::to_string(m.latency.count()) +
                                " texts=" + std::to_string(m.texts));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace clausekit::observability

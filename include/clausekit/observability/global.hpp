#pragma once

#include "clausekit/observability/observer.hpp"

#include <memory>

namespace clausekit::observability {

/// Process-wide sink; events recorded before one is installed are dropped.
void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_pipeline_start(std::size_t elements, const std::string &classifier,
                           const std::string &strategy);
void record_pipeline_end(std::chrono::milliseconds duration, std::size_t sections,
                         std::size_t chunks);
void record_split_fallback(std::size_t size, std::size_t max_size);
void record_classifier_fallback(const std::string &backend, const std::string &reason,
                                std::size_t texts);
void record_config_warning(const std::string &key, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace clausekit::observability

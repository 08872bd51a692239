#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace clausekit::observability {

struct PipelineStartEvent {
  std::size_t elements = 0;
  std::string classifier;
  std::string strategy;
};

struct PipelineEndEvent {
  std::chrono::milliseconds duration{0};
  std::size_t sections = 0;
  std::size_t chunks = 0;
};

/// A sentence longer than the size limit was emitted on its own.
struct SplitFallbackEvent {
  std::size_t size = 0;
  std::size_t max_size = 0;
};

struct ClassifierFallbackEvent {
  std::string backend;
  std::string reason;
  std::size_t texts = 0;
};

struct ConfigWarningEvent {
  std::string key;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<PipelineStartEvent, PipelineEndEvent, SplitFallbackEvent,
                                   ClassifierFallbackEvent, ConfigWarningEvent, ErrorEvent>;

struct ChunksEmittedMetric {
  std::uint64_t count = 0;
};

struct DuplicatesDroppedMetric {
  std::uint64_t count = 0;
};

struct ClassifierLatencyMetric {
  std::chrono::milliseconds latency{0};
  std::uint64_t texts = 0;
};

using ObserverMetric =
    std::variant<ChunksEmittedMetric, DuplicatesDroppedMetric, ClassifierLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace clausekit::observability

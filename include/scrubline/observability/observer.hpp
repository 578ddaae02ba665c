#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace scrubline::observability {

struct DocumentLoadedEvent {
  std::string source;
  std::size_t bytes = 0;
  std::size_t message_count = 0;
};

struct MessagePatchedEvent {
  std::size_t index = 0;
  std::string role;
  std::size_t length_before = 0;
  std::size_t length_after = 0;
};

struct RuleAppliedEvent {
  std::string rule;
  std::size_t pass = 0;
  std::size_t length_before = 0;
  std::size_t length_after = 0;
};

struct ToolCallRepairedEvent {
  std::size_t message_index = 0;
  std::size_t call_index = 0;
  std::string detail;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<DocumentLoadedEvent, MessagePatchedEvent, RuleAppliedEvent,
                                   ToolCallRepairedEvent, ErrorEvent>;

struct BytesRemovedMetric {
  std::size_t bytes = 0;
};

struct SanitizeLatencyMetric {
  std::chrono::microseconds latency{0};
};

using ObserverMetric = std::variant<BytesRemovedMetric, SanitizeLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace scrubline::observability

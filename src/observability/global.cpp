#include "scrubline/observability/global.hpp"

#include <mutex>

namespace scrubline::observability {

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

void record_document_loaded(const std::string &source, const std::size_t bytes,
                            const std::size_t message_count) {
  record_event(
      DocumentLoadedEvent{.source = source, .bytes = bytes, .message_count = message_count});
}

void record_message_patched(const std::size_t index, const std::string &role,
                            const std::size_t length_before, const std::size_t length_after) {
  record_event(MessagePatchedEvent{.index = index,
                                   .role = role,
                                   .length_before = length_before,
                                   .length_after = length_after});
}

void record_rule_applied(const std::string &rule, const std::size_t pass,
                         const std::size_t length_before, const std::size_t length_after) {
  record_event(RuleAppliedEvent{
      .rule = rule, .pass = pass, .length_before = length_before, .length_after = length_after});
}

void record_tool_call_repaired(const std::size_t message_index, const std::size_t call_index,
                               const std::string &detail) {
  record_event(ToolCallRepairedEvent{
      .message_index = message_index, .call_index = call_index, .detail = detail});
}

void record_bytes_removed(const std::size_t bytes) { record_metric(BytesRemovedMetric{.bytes = bytes}); }

void record_sanitize_latency(const std::chrono::microseconds latency) {
  record_metric(SanitizeLatencyMetric{.latency = latency});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace scrubline::observability

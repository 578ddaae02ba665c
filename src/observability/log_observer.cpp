#include "scrubline/observability/log_observer.hpp"

#include <type_traits>

namespace scrubline::observability {

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  if (level == "DEBUG" && !verbose_) {
    return;
  }
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, DocumentLoadedEvent>) {
          log_line("INFO", "document.loaded source=" + evt.source +
                               " bytes=" + std::to_string(evt.bytes) +
                               " messages=" + std::to_string(evt.message_count));
        } else if constexpr (std::is_same_v<T, MessagePatchedEvent>) {
          log_line("INFO", "message.patched index=" + std::to_string(evt.index) +
                               " role=" + evt.role + " length=" +
                               std::to_string(evt.length_before) + "->" +
                               std::to_string(evt.length_after));
        } else if constexpr (std::is_same_v<T, RuleAppliedEvent>) {
          log_line("DEBUG", "rule.applied name=" + evt.rule + " pass=" + std::to_string(evt.pass) +
                                " length=" + std::to_string(evt.length_before) + "->" +
                                std::to_string(evt.length_after));
        } else if constexpr (std::is_same_v<T, ToolCallRepairedEvent>) {
          log_line("INFO", "tool_call.repaired message=" + std::to_string(evt.message_index) +
                               " call=" + std::to_string(evt.call_index) + " " + evt.detail);
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
        if constexpr (std::is_same_v<T, BytesRemovedMetric>) {
          log_line("DEBUG", "metric.bytes_removed=" + std::to_string(m.bytes));
        } else if constexpr (std::is_same_v<T, SanitizeLatencyMetric>) {
          log_line("DEBUG", "metric.sanitize_latency_us=" + std::to_string(m.latency.count()));
        }
      },
      metric);
}

} // namespace scrubline::observability

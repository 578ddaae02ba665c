#pragma once

#include "scrubline/observability/observer.hpp"

#include <chrono>
#include <memory>

namespace scrubline::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_document_loaded(const std::string &source, std::size_t bytes,
                            std::size_t message_count);
void record_message_patched(std::size_t index, const std::string &role, std::size_t length_before,
                            std::size_t length_after);
void record_rule_applied(const std::string &rule, std::size_t pass, std::size_t length_before,
                         std::size_t length_after);
void record_tool_call_repaired(std::size_t message_index, std::size_t call_index,
                               const std::string &detail);
void record_bytes_removed(std::size_t bytes);
void record_sanitize_latency(std::chrono::microseconds latency);
void record_error(const std::string &component, const std::string &message);

} // namespace scrubline::observability

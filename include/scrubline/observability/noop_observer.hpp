#pragma once

#include "scrubline/observability/observer.hpp"

namespace scrubline::observability {

/// Backend for `observability.backend = "none"`. Patch, rule and tool-call
/// events are dropped, so a run writes only the document and its report.
class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace scrubline::observability

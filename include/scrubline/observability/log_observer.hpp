#pragma once

#include "scrubline/observability/observer.hpp"

#include <iostream>
#include <ostream>

namespace scrubline::observability {

/// Writes one `[LEVEL] message` line per event. DEBUG lines (rule and
/// metric detail) are only written when `verbose` is set.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(std::ostream &out = std::cerr, bool verbose = false)
      : out_(out), verbose_(verbose) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override { out_.flush(); }
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(std::string_view level, const std::string &message);

  std::ostream &out_;
  bool verbose_;
};

} // namespace scrubline::observability

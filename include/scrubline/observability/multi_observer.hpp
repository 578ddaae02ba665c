#pragma once

#include "scrubline/observability/observer.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace scrubline::observability {

/// Fan-out for comma-separated backends such as `log,verbose`. Every event the
/// patcher, the tool-call normalizer and the CLI record reaches each backend in
/// the order the backends were listed.
class MultiObserver final : public IObserver {
public:
  /// Null observers and `noop` backends are not kept.
  void add(std::unique_ptr<IObserver> observer);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace scrubline::observability

#pragma once

#include "scrubline/config/schema.hpp"
#include "scrubline/observability/observer.hpp"

#include <memory>

namespace scrubline::observability {

[[nodiscard]] bool is_known_backend(const std::string &backend);

/// Observer for `config.observability.backend`: "log", "verbose", "noop"
/// ("none", empty) or a comma-separated combination of them.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace scrubline::observability

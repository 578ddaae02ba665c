#include "scrubline/observability/factory.hpp"

#include "scrubline/common/fs.hpp"
#include "scrubline/observability/log_observer.hpp"
#include "scrubline/observability/multi_observer.hpp"
#include "scrubline/observability/noop_observer.hpp"

#include <iostream>
#include <sstream>
#include <vector>

namespace scrubline::observability {

namespace {

std::vector<std::string> split_backends(const std::string &backend) {
  std::vector<std::string> parts;
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    parts.push_back(common::to_lower(common::trim(part)));
  }
  return parts;
}

std::unique_ptr<IObserver> create_single(const std::string &name) {
  if (name == "log") {
    return std::make_unique<LogObserver>(std::cerr, false);
  }
  if (name == "verbose") {
    return std::make_unique<LogObserver>(std::cerr, true);
  }
  return std::make_unique<NoopObserver>();
}

} // namespace

bool is_known_backend(const std::string &backend) {
  for (const auto &part : split_backends(backend)) {
    if (part != "log" && part != "verbose" && part != "noop" && part != "none" && !part.empty()) {
      return false;
    }
  }
  return true;
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    for (const auto &part : split_backends(backend)) {
      if (!part.empty()) {
        multi->add(create_single(part));
      }
    }
    return multi;
  }

  if (backend == "verbose") {
    return create_single(backend);
  }
  return create_single("log");
}

} // namespace scrubline::observability

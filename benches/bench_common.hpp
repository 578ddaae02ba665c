#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <iostream>
#include <string>

namespace scrubline::bench {

// bytes_per_iteration > 0 adds a throughput column for text workloads.
inline void run_bench(const std::string &name, int iterations, const std::function<void()> &fn,
                      std::size_t bytes_per_iteration = 0) {
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto end = std::chrono::steady_clock::now();
  const auto total = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
  const double avg = static_cast<double>(total) / static_cast<double>(iterations);
  std::cout << name << ": iterations=" << iterations << " total_us=" << total << " avg_us=" << avg;
  if (bytes_per_iteration > 0 && total > 0) {
    const double bytes = static_cast<double>(bytes_per_iteration) * iterations;
    std::cout << " mb_per_s=" << bytes / static_cast<double>(total);
  }
  std::cout << "\n";
}

} // namespace scrubline::bench

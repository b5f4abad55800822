#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <string>

namespace warden::bench {

/// Times `iterations` calls of fn and prints one summary line.
inline void run_bench(const std::string &name, int iterations,
                      const std::function<void()> &fn) {
  if (iterations <= 0) {
    return;
  }
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto elapsed = std::chrono::steady_clock::now() - start;
  const auto total_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count();
  const double avg_us = static_cast<double>(total_ns) / 1000.0 / static_cast<double>(iterations);
  const double per_second =
      total_ns == 0 ? 0.0 : static_cast<double>(iterations) * 1e9 / static_cast<double>(total_ns);
  std::cout << name << ": iterations=" << iterations << " total_us=" << total_ns / 1000
            << " avg_us=" << avg_us << " ops_per_sec=" << static_cast<long long>(per_second)
            << "\n";
}

} // namespace warden::bench

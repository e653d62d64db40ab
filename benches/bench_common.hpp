#pragma once

#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <string>

namespace quotaswap::bench {

/// Time `iterations` calls of `fn` and print total, mean and throughput.
inline void run_bench(const std::string &name, const int iterations,
                      const std::function<void()> &fn) {
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                           std::chrono::steady_clock::now() - start)
                           .count();
  const double avg_us = static_cast<double>(elapsed) / static_cast<double>(iterations);
  const double per_sec = avg_us > 0.0 ? 1'000'000.0 / avg_us : 0.0;
  std::cout << std::left << std::setw(28) << name << " iterations=" << iterations
            << " total_us=" << elapsed << " avg_us=" << std::fixed << std::setprecision(2)
            << avg_us << " ops_per_sec=" << std::setprecision(0) << per_sec << "\n";
  std::cout.unsetf(std::ios::floatfield);
}

} // namespace quotaswap::bench

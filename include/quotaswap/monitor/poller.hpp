#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

namespace quotaswap::monitor {

/// Fixed-interval timer for the active usage check. The first fire counts as
/// user-initiated, later ones as timer-initiated.
class Poller {
public:
  using FireFn = std::function<bool(bool user_initiated)>;

  Poller(FireFn fire, std::chrono::milliseconds interval);
  ~Poller();

  Poller(const Poller &) = delete;
  Poller &operator=(const Poller &) = delete;

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::uint64_t fires() const { return fires_; }
  [[nodiscard]] std::uint64_t dropped() const { return dropped_; }

private:
  void run_loop();

  FireFn fire_;
  std::chrono::milliseconds interval_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> fires_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

} // namespace quotaswap::monitor

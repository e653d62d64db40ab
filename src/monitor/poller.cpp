#include "quotaswap/monitor/poller.hpp"

#include <algorithm>

namespace quotaswap::monitor {

namespace {

constexpr auto SLEEP_STEP = std::chrono::milliseconds(100);

} // namespace

Poller::Poller(FireFn fire, const std::chrono::milliseconds interval)
    : fire_(std::move(fire)), interval_(interval) {}

Poller::~Poller() { stop(); }

void Poller::start() {
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
}

void Poller::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool Poller::is_running() const { return running_; }

void Poller::run_loop() {
  bool first = true;
  while (running_) {
    if (fire_(first)) {
      ++fires_;
    } else {
      ++dropped_;
    }
    first = false;

    const auto step = std::min(SLEEP_STEP, interval_);
    const auto wait_steps = std::max<long long>(1, interval_.count() / std::max<long long>(1, step.count()));
    for (long long i = 0; i < wait_steps && running_; ++i) {
      std::this_thread::sleep_for(step);
    }
  }
}

} // namespace quotaswap::monitor

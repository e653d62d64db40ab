#pragma once

#include "quotaswap/common/result.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace quotaswap::monitor {

struct LogWatcherConfig {
  std::vector<std::string> globs;
  std::string pattern;
  std::chrono::milliseconds poll_interval{1000};
};

/// Tails log files matching `globs` and reports the billing error pattern.
/// Files present at the first pass are read from their current end; files that
/// appear later are read from the start. A file that shrinks is re-read from 0.
class LogWatcher {
public:
  using Callback = std::function<void(const std::string &source)>;

  LogWatcher(LogWatcherConfig config, Callback on_payment_error);
  ~LogWatcher();

  LogWatcher(const LogWatcher &) = delete;
  LogWatcher &operator=(const LogWatcher &) = delete;

  [[nodiscard]] common::Status start();
  void stop();
  [[nodiscard]] bool is_running() const;

  /// One polling pass. Returns the file that matched, at most one per pass.
  [[nodiscard]] common::Result<std::optional<std::string>> scan_once();

  [[nodiscard]] std::size_t tracked_files() const;

private:
  void run_loop();
  [[nodiscard]] std::vector<std::string> expand_globs() const;

  LogWatcherConfig config_;
  Callback on_payment_error_;
  std::optional<std::regex> pattern_;
  std::string pattern_error_;

  mutable std::mutex scan_mutex_;
  std::unordered_map<std::string, std::uintmax_t> positions_;
  bool primed_ = false;

  std::thread thread_;
  std::atomic<bool> running_{false};
};

} // namespace quotaswap::monitor

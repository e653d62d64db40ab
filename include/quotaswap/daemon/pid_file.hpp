#pragma once

#include "quotaswap/common/result.hpp"

#include <filesystem>
#include <optional>

namespace quotaswap::daemon {

/// Single-instance lock: a file holding the owner's pid, created exclusively.
/// A file left behind by a dead process is taken over.
class PidFile {
public:
  explicit PidFile(std::filesystem::path path);
  ~PidFile();

  PidFile(const PidFile &) = delete;
  PidFile &operator=(const PidFile &) = delete;

  [[nodiscard]] common::Status acquire();
  void release();
  [[nodiscard]] bool held() const { return acquired_; }

  /// Pid recorded in `path` if that process is still alive.
  [[nodiscard]] static std::optional<int> live_owner(const std::filesystem::path &path);
  [[nodiscard]] static bool is_process_running(int pid);

private:
  std::filesystem::path path_;
  bool acquired_ = false;
};

} // namespace quotaswap::daemon

#include "quotaswap/daemon/pid_file.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

namespace quotaswap::daemon {

namespace {

int read_pid(const std::filesystem::path &path) {
  std::ifstream in(path);
  int pid = 0;
  in >> pid;
  return in ? pid : 0;
}

} // namespace

PidFile::PidFile(std::filesystem::path path) : path_(std::move(path)) {}

PidFile::~PidFile() { release(); }

common::Status PidFile::acquire() {
  if (acquired_) {
    return common::Status::success();
  }

  std::error_code ec;
  if (!path_.parent_path().empty()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      return common::Status::error("failed to create lock directory: " + ec.message());
    }
  }

  // Two attempts: the second runs after clearing a stale file.
  for (int attempt = 0; attempt < 2; ++attempt) {
    const int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd >= 0) {
      const std::string content = std::to_string(static_cast<int>(getpid())) + "\n";
      const auto written = ::write(fd, content.data(), content.size());
      ::close(fd);
      if (written != static_cast<ssize_t>(content.size())) {
        std::filesystem::remove(path_, ec);
        return common::Status::error("failed to write lock file " + path_.string());
      }
      acquired_ = true;
      return common::Status::success();
    }
    if (errno != EEXIST) {
      return common::Status::error("failed to create lock file " + path_.string() + ": " +
                                   std::strerror(errno));
    }

    if (const auto owner = live_owner(path_); owner.has_value()) {
      return common::Status::error("another quotaswap instance is running with pid " +
                                   std::to_string(*owner));
    }
    std::filesystem::remove(path_, ec);
  }

  return common::Status::error("unable to take over stale lock file " + path_.string());
}

void PidFile::release() {
  if (!acquired_) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  acquired_ = false;
}

std::optional<int> PidFile::live_owner(const std::filesystem::path &path) {
  const int pid = read_pid(path);
  if (pid > 0 && is_process_running(pid)) {
    return pid;
  }
  return std::nullopt;
}

bool PidFile::is_process_running(const int pid) {
  if (pid <= 0) {
    return false;
  }
  return kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace quotaswap::daemon

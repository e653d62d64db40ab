#include "quotaswap/monitor/log_watcher.hpp"

#include "quotaswap/common/fs.hpp"
#include "quotaswap/observability/global.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <unordered_set>

#include <glob.h>

namespace quotaswap::monitor {

namespace {

constexpr auto SLEEP_STEP = std::chrono::milliseconds(100);

// std::regex recurses per character of the subject, so long lines are matched
// through overlapping windows. A match no longer than MATCH_OVERLAP always lies
// wholly inside one window.
constexpr std::size_t MATCH_WINDOW = 4096;
constexpr std::size_t MATCH_OVERLAP = 1024;

std::optional<std::string> read_range(const std::string &path, const std::uintmax_t from,
                                      const std::uintmax_t to) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  in.seekg(static_cast<std::streamoff>(from));
  std::string chunk(static_cast<std::size_t>(to - from), '\0');
  in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
  chunk.resize(static_cast<std::size_t>(in.gcount()));
  return chunk;
}

bool line_matches(const std::string_view line, const std::regex &pattern) {
  if (line.size() <= MATCH_WINDOW) {
    return std::regex_search(line.begin(), line.end(), pattern);
  }
  for (std::size_t offset = 0;; offset += MATCH_WINDOW - MATCH_OVERLAP) {
    const auto window = line.substr(offset, MATCH_WINDOW);
    if (std::regex_search(window.begin(), window.end(), pattern)) {
      return true;
    }
    if (offset + MATCH_WINDOW >= line.size()) {
      return false;
    }
  }
}

bool chunk_matches(const std::string &chunk, const std::regex &pattern) {
  const std::string_view text(chunk);
  std::size_t start = 0;
  while (start < text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    if (line_matches(text.substr(start, end - start), pattern)) {
      return true;
    }
    start = end + 1;
  }
  return false;
}

} // namespace

LogWatcher::LogWatcher(LogWatcherConfig config, Callback on_payment_error)
    : config_(std::move(config)), on_payment_error_(std::move(on_payment_error)) {
  try {
    pattern_.emplace(config_.pattern);
  } catch (const std::regex_error &e) {
    pattern_error_ = e.what();
  }
}

LogWatcher::~LogWatcher() { stop(); }

common::Status LogWatcher::start() {
  if (running_) {
    return common::Status::success();
  }
  if (!pattern_.has_value()) {
    return common::Status::error("invalid log error pattern: " + pattern_error_);
  }
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
  return common::Status::success();
}

void LogWatcher::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool LogWatcher::is_running() const { return running_; }

std::size_t LogWatcher::tracked_files() const {
  std::lock_guard<std::mutex> lock(scan_mutex_);
  return positions_.size();
}

std::vector<std::string> LogWatcher::expand_globs() const {
  std::vector<std::string> files;
  for (const auto &pattern : config_.globs) {
    glob_t matches{};
    if (::glob(pattern.c_str(), 0, nullptr, &matches) == 0) {
      for (std::size_t i = 0; i < matches.gl_pathc; ++i) {
        files.emplace_back(matches.gl_pathv[i]);
      }
    }
    ::globfree(&matches);
  }
  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());
  return files;
}

common::Result<std::optional<std::string>> LogWatcher::scan_once() {
  using ScanResult = common::Result<std::optional<std::string>>;
  if (!pattern_.has_value()) {
    return ScanResult::failure("invalid log error pattern: " + pattern_error_);
  }

  std::optional<std::string> hit;
  {
    std::lock_guard<std::mutex> lock(scan_mutex_);
    const auto files = expand_globs();
    std::unordered_set<std::string> seen;

    for (const auto &path : files) {
      std::error_code ec;
      const auto size = std::filesystem::file_size(path, ec);
      if (ec) {
        continue;
      }
      seen.insert(path);

      auto it = positions_.find(path);
      if (it == positions_.end()) {
        positions_[path] = primed_ ? 0 : size;
        if (!primed_) {
          continue;
        }
        it = positions_.find(path);
      }

      auto &position = it->second;
      if (size < position) {
        position = 0;
      }
      if (size == position) {
        continue;
      }

      const auto chunk = read_range(path, position, size);
      position = size;
      if (chunk.has_value() && !hit.has_value() && chunk_matches(*chunk, *pattern_)) {
        hit = path;
      }
    }

    std::erase_if(positions_, [&](const auto &entry) { return !seen.contains(entry.first); });
    primed_ = true;
  }

  if (hit.has_value()) {
    observability::record_payment_error(*hit);
    if (on_payment_error_) {
      on_payment_error_(*hit);
    }
  }
  return ScanResult::success(hit);
}

void LogWatcher::run_loop() {
  while (running_) {
    const auto scanned = scan_once();
    if (!scanned.ok()) {
      observability::record_error("log_watcher", scanned.error());
    }
    const auto step = std::min(SLEEP_STEP, config_.poll_interval);
    const auto wait_steps =
        std::max<long long>(1, config_.poll_interval.count() / std::max<long long>(1, step.count()));
    for (long long i = 0; i < wait_steps && running_; ++i) {
      std::this_thread::sleep_for(step);
    }
  }
}

} // namespace quotaswap::monitor

#include "quotaswap/common/fs.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

#include <unistd.h>

namespace quotaswap::common {

namespace {

std::atomic<std::uint64_t> g_temp_sequence{0};

void remove_quietly(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

} // namespace

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::vector<std::string> split(const std::string &value, const std::string &separator) {
  std::vector<std::string> parts;
  if (separator.empty()) {
    parts.push_back(value);
    return parts;
  }
  std::size_t start = 0;
  while (true) {
    const auto pos = value.find(separator, start);
    if (pos == std::string::npos) {
      parts.push_back(value.substr(start));
      break;
    }
    parts.push_back(value.substr(start, pos - start));
    start = pos + separator.size();
  }
  return parts;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("Failed to create directory: " +
                                                  path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  static const std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

std::int64_t now_millis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return Result<std::string>::failure("unable to open " + path.string());
  }
  std::ostringstream buf;
  buf << file.rdbuf();
  if (file.bad()) {
    return Result<std::string>::failure("failed reading " + path.string());
  }
  return Result<std::string>::success(buf.str());
}

std::filesystem::path temp_sibling_path(const std::filesystem::path &path) {
  const auto seq = g_temp_sequence.fetch_add(1);
  std::string name = path.filename().string();
  name += ".tmp-" + std::to_string(static_cast<long long>(getpid())) + "-" +
          std::to_string(now_millis()) + "-" + std::to_string(seq);
  return path.parent_path() / name;
}

Status atomic_write_file(const std::filesystem::path &path, const std::string &content) {
  if (path.empty()) {
    return Status::error("empty target path");
  }

  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return Status::error("failed to create directory " + path.parent_path().string() + ": " +
                           ec.message());
    }
  }

  const auto tmp_path = temp_sibling_path(path);
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return Status::error("unable to open temporary file " + tmp_path.string());
    }
    out << content;
    out.flush();
    if (!out) {
      out.close();
      remove_quietly(tmp_path);
      return Status::error("failed writing temporary file " + tmp_path.string());
    }
  }

  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    remove_quietly(tmp_path);
    return Status::error("failed to atomically replace " + path.string() + ": " + ec.message());
  }

  return Status::success();
}

} // namespace quotaswap::common

#pragma once

#include "quotaswap/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace quotaswap::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value,
                                             const std::string &separator);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Milliseconds since the Unix epoch (wall clock).
[[nodiscard]] std::int64_t now_millis();

/// Read a whole file. Fails if the file is missing or unreadable.
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Temporary sibling used by atomic_write_file: `<name>.tmp-<pid>-<ms>-<seq>`.
[[nodiscard]] std::filesystem::path temp_sibling_path(const std::filesystem::path &path);

/// Write `content` to a temporary sibling of `path`, then rename it over `path`.
/// Readers never observe a partial document; the temporary file is removed on failure.
[[nodiscard]] Status atomic_write_file(const std::filesystem::path &path,
                                       const std::string &content);

} // namespace quotaswap::common

#pragma once

#include "quotaswap/common/result.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace quotaswap::common {

/// Flat view of a TOML file. Keys inside `[section]` are stored as `section.key`,
/// values keep their raw text until read through a typed getter.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] int get_int(const std::string &key, int fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

/// Basic (double-quoted) TOML string with `"` and `\` escaped.
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace quotaswap::common

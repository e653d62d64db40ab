#include "quotaswap/config/config.hpp"

#include "quotaswap/common/fs.hpp"
#include "quotaswap/common/toml.hpp"

#include <cstdlib>
#include <regex>
#include <sstream>

namespace quotaswap::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".quotaswap";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("QUOTASWAP_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

void expand_paths(Config &config) {
  config.store.active_path = common::expand_path(config.store.active_path);
  config.store.reserve_path = common::expand_path(config.store.reserve_path);
  config.store.lock_path = common::expand_path(config.store.lock_path);
  for (auto &pattern : config.monitor.log_globs) {
    pattern = common::expand_path(pattern);
  }
}

std::string bool_to_toml(const bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

bool threshold_in_range(const double value) { return value > 0.0 && value <= 1.0; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *active = std::getenv("QUOTASWAP_ACTIVE_PATH"); active != nullptr && *active) {
    config.store.active_path = common::expand_path(active);
  }
  if (const char *reserve = std::getenv("QUOTASWAP_RESERVE_PATH"); reserve != nullptr && *reserve) {
    config.store.reserve_path = common::expand_path(reserve);
  }
  if (const char *backend = std::getenv("QUOTASWAP_OBSERVABILITY");
      backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> load_config() {
  Config config;

  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Result<Config>::failure(path_result.error());
  }

  const auto path = path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    expand_paths(config);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  const auto parsed = common::parse_toml(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  const auto &doc = parsed.value();

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  config.store.active_path = doc.get_string("store.active_path", config.store.active_path);
  config.store.reserve_path = doc.get_string("store.reserve_path", config.store.reserve_path);
  config.store.lock_path = doc.get_string("store.lock_path", config.store.lock_path);

  config.remote.client_id = doc.get_string("remote.client_id", config.remote.client_id);
  config.remote.refresh_url = doc.get_string("remote.refresh_url", config.remote.refresh_url);
  config.remote.usage_url = doc.get_string("remote.usage_url", config.remote.usage_url);
  config.remote.timeout_ms = doc.get_int("remote.timeout_ms", config.remote.timeout_ms);
  config.remote.shutdown_timeout_ms =
      doc.get_int("remote.shutdown_timeout_ms", config.remote.shutdown_timeout_ms);

  config.failover.warn_threshold =
      doc.get_double("failover.warn_threshold", config.failover.warn_threshold);
  config.failover.exhausted_threshold =
      doc.get_double("failover.exhausted_threshold", config.failover.exhausted_threshold);
  config.failover.alert_threshold =
      doc.get_double("failover.alert_threshold", config.failover.alert_threshold);
  config.failover.auto_on_exhaustion =
      doc.get_bool("failover.auto_on_exhaustion", config.failover.auto_on_exhaustion);

  config.monitor.interval_secs = doc.get_int("monitor.interval_secs", config.monitor.interval_secs);
  config.monitor.log_poll_ms = doc.get_int("monitor.log_poll_ms", config.monitor.log_poll_ms);
  config.monitor.log_globs = doc.get_string_array("monitor.log_globs", config.monitor.log_globs);
  config.monitor.error_pattern =
      doc.get_string("monitor.error_pattern", config.monitor.error_pattern);

  expand_paths(config);
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Status::error(path_result.error());
  }

  std::ostringstream file;
  file << "[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  file << "\n[store]\n";
  file << "active_path = " << common::quote_toml_string(config.store.active_path) << "\n";
  file << "reserve_path = " << common::quote_toml_string(config.store.reserve_path) << "\n";
  file << "lock_path = " << common::quote_toml_string(config.store.lock_path) << "\n";

  file << "\n[remote]\n";
  file << "client_id = " << common::quote_toml_string(config.remote.client_id) << "\n";
  file << "refresh_url = " << common::quote_toml_string(config.remote.refresh_url) << "\n";
  file << "usage_url = " << common::quote_toml_string(config.remote.usage_url) << "\n";
  file << "timeout_ms = " << config.remote.timeout_ms << "\n";
  file << "shutdown_timeout_ms = " << config.remote.shutdown_timeout_ms << "\n";

  file << "\n[failover]\n";
  file << "warn_threshold = " << config.failover.warn_threshold << "\n";
  file << "exhausted_threshold = " << config.failover.exhausted_threshold << "\n";
  file << "alert_threshold = " << config.failover.alert_threshold << "\n";
  file << "auto_on_exhaustion = " << bool_to_toml(config.failover.auto_on_exhaustion) << "\n";

  file << "\n[monitor]\n";
  file << "interval_secs = " << config.monitor.interval_secs << "\n";
  file << "log_poll_ms = " << config.monitor.log_poll_ms << "\n";
  file << "log_globs = " << string_array_to_toml(config.monitor.log_globs) << "\n";
  file << "error_pattern = " << common::quote_toml_string(config.monitor.error_pattern) << "\n";

  const auto written = common::atomic_write_file(path_result.value(), file.str());
  if (!written.ok()) {
    return common::Status::error("Failed to save config: " + written.error());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  for (const auto &backend : common::split(config.observability.backend, ",")) {
    const std::string name = common::to_lower(common::trim(backend));
    if (name != "log" && name != "none" && name != "noop") {
      return Warnings::failure("Invalid observability.backend: " + config.observability.backend);
    }
  }

  if (common::trim(config.store.active_path).empty() ||
      common::trim(config.store.reserve_path).empty()) {
    return Warnings::failure("store.active_path and store.reserve_path are required");
  }
  if (config.store.active_path == config.store.reserve_path) {
    return Warnings::failure("store.active_path and store.reserve_path must differ");
  }

  if (common::trim(config.remote.client_id).empty()) {
    return Warnings::failure("remote.client_id is required");
  }
  if (common::trim(config.remote.refresh_url).empty() ||
      common::trim(config.remote.usage_url).empty()) {
    return Warnings::failure("remote.refresh_url and remote.usage_url are required");
  }
  if (!common::starts_with(config.remote.refresh_url, "https://") ||
      !common::starts_with(config.remote.usage_url, "https://")) {
    warnings.push_back("remote endpoints are not using https");
  }
  if (config.remote.timeout_ms <= 0 || config.remote.shutdown_timeout_ms <= 0) {
    return Warnings::failure("remote timeouts must be positive");
  }

  if (!threshold_in_range(config.failover.warn_threshold) ||
      !threshold_in_range(config.failover.exhausted_threshold) ||
      !threshold_in_range(config.failover.alert_threshold)) {
    return Warnings::failure("failover thresholds must be in (0, 1]");
  }
  if (config.failover.warn_threshold > config.failover.exhausted_threshold) {
    warnings.push_back("failover.warn_threshold is above failover.exhausted_threshold");
  }

  if (config.monitor.interval_secs <= 0) {
    return Warnings::failure("monitor.interval_secs must be positive");
  }
  if (config.monitor.log_poll_ms <= 0) {
    return Warnings::failure("monitor.log_poll_ms must be positive");
  }
  if (config.monitor.log_globs.empty()) {
    warnings.push_back("monitor.log_globs is empty; log watching is disabled");
  }
  try {
    const std::regex compiled(config.monitor.error_pattern);
    (void)compiled;
  } catch (const std::regex_error &e) {
    return Warnings::failure(std::string("monitor.error_pattern does not compile: ") + e.what());
  }

  return Warnings::success(std::move(warnings));
}

} // namespace quotaswap::config

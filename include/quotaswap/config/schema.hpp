#pragma once

#include <string>
#include <vector>

namespace quotaswap::config {

struct ObservabilityConfig {
  std::string backend = "log";
};

struct StoreConfig {
  std::string active_path = "~/.factory/auth.json";
  std::string reserve_path = "~/.quotaswap/tokens.json";
  std::string lock_path = "~/.quotaswap/quotaswap.pid";
};

struct RemoteConfig {
  std::string client_id = "client_01HNM792M5G5G1A2THWPXKFMXB";
  std::string refresh_url = "https://api.workos.com/user_management/authenticate";
  std::string usage_url = "https://app.factory.ai/api/organization/members/chat-usage";
  int timeout_ms = 30'000;
  int shutdown_timeout_ms = 5'000;
};

struct FailoverConfig {
  double warn_threshold = 0.9;
  double exhausted_threshold = 1.0;
  double alert_threshold = 0.99;
  bool auto_on_exhaustion = true;
};

struct MonitorConfig {
  int interval_secs = 90;
  int log_poll_ms = 1'000;
  std::vector<std::string> log_globs = {"~/.factory/logs/*.log"};
  std::string error_pattern =
      R"(Ready for more\? Reload your tokens.*?https://app\.factory\.ai/settings/billing)";
};

struct Config {
  ObservabilityConfig observability;
  StoreConfig store;
  RemoteConfig remote;
  FailoverConfig failover;
  MonitorConfig monitor;
};

} // namespace quotaswap::config

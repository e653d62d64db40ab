#pragma once

#include "quotaswap/common/result.hpp"
#include "quotaswap/config/schema.hpp"
#include "quotaswap/monitor/coordinator.hpp"
#include "quotaswap/monitor/log_watcher.hpp"
#include "quotaswap/monitor/poller.hpp"
#include "quotaswap/pool/failover.hpp"
#include "quotaswap/pool/store.hpp"
#include "quotaswap/usage/oracle.hpp"
#include "quotaswap/usage/remote.hpp"

#include <memory>

namespace quotaswap::runtime {

/// Assembles the store, remote API, oracle and failover engine from a Config.
/// Components are built on first use and shared afterwards.
class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config, std::shared_ptr<usage::RemoteApi> remote = nullptr);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  /// Route process-wide observability through the configured backend.
  void install_observer() const;

  [[nodiscard]] std::shared_ptr<pool::CredentialStore> store();
  [[nodiscard]] std::shared_ptr<usage::RemoteApi> remote();
  [[nodiscard]] std::shared_ptr<usage::UsageOracle> oracle();
  [[nodiscard]] std::shared_ptr<pool::FailoverEngine> failover();

  [[nodiscard]] std::unique_ptr<monitor::Coordinator> create_coordinator();
  [[nodiscard]] std::unique_ptr<monitor::Poller> create_poller(monitor::Coordinator &coordinator) const;
  [[nodiscard]] std::unique_ptr<monitor::LogWatcher>
  create_log_watcher(monitor::Coordinator &coordinator) const;

private:
  config::Config config_;
  std::shared_ptr<usage::RemoteApi> remote_;
  std::shared_ptr<pool::CredentialStore> store_;
  std::shared_ptr<usage::UsageOracle> oracle_;
  std::shared_ptr<pool::FailoverEngine> failover_;
};

} // namespace quotaswap::runtime

#include "quotaswap/runtime/app.hpp"

#include "quotaswap/config/config.hpp"
#include "quotaswap/observability/factory.hpp"
#include "quotaswap/observability/global.hpp"

namespace quotaswap::runtime {

RuntimeContext::RuntimeContext(config::Config config, std::shared_ptr<usage::RemoteApi> remote)
    : config_(std::move(config)), remote_(std::move(remote)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.error());
  }
  const auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<RuntimeContext>::failure("invalid configuration: " + validated.error());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

void RuntimeContext::install_observer() const {
  observability::set_global_observer(observability::create_observer(config_));
}

std::shared_ptr<pool::CredentialStore> RuntimeContext::store() {
  if (store_ == nullptr) {
    store_ = std::make_shared<pool::CredentialStore>(config_.store.active_path,
                                                     config_.store.reserve_path);
  }
  return store_;
}

std::shared_ptr<usage::RemoteApi> RuntimeContext::remote() {
  if (remote_ == nullptr) {
    remote_ = std::make_shared<usage::HttpRemoteApi>(config_.remote);
  }
  return remote_;
}

std::shared_ptr<usage::UsageOracle> RuntimeContext::oracle() {
  if (oracle_ == nullptr) {
    oracle_ = std::make_shared<usage::UsageOracle>(remote());
  }
  return oracle_;
}

std::shared_ptr<pool::FailoverEngine> RuntimeContext::failover() {
  if (failover_ == nullptr) {
    failover_ = std::make_shared<pool::FailoverEngine>(
        store(), oracle(), config_.failover, static_cast<std::uint64_t>(config_.remote.timeout_ms));
  }
  return failover_;
}

std::unique_ptr<monitor::Coordinator> RuntimeContext::create_coordinator() {
  return std::make_unique<monitor::Coordinator>(store(), oracle(), failover(), config_);
}

std::unique_ptr<monitor::Poller>
RuntimeContext::create_poller(monitor::Coordinator &coordinator) const {
  return std::make_unique<monitor::Poller>(
      [&coordinator](const bool user_initiated) { return coordinator.check_active(user_initiated); },
      std::chrono::seconds(config_.monitor.interval_secs));
}

std::unique_ptr<monitor::LogWatcher>
RuntimeContext::create_log_watcher(monitor::Coordinator &coordinator) const {
  monitor::LogWatcherConfig watcher_config;
  watcher_config.globs = config_.monitor.log_globs;
  watcher_config.pattern = config_.monitor.error_pattern;
  watcher_config.poll_interval = std::chrono::milliseconds(config_.monitor.log_poll_ms);
  return std::make_unique<monitor::LogWatcher>(
      std::move(watcher_config),
      [&coordinator](const std::string &source) { coordinator.on_payment_error(source); });
}

} // namespace quotaswap::runtime

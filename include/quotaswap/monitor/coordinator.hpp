#pragma once

#include "quotaswap/common/result.hpp"
#include "quotaswap/config/schema.hpp"
#include "quotaswap/pool/failover.hpp"
#include "quotaswap/pool/store.hpp"
#include "quotaswap/usage/oracle.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

namespace quotaswap::monitor {

enum class Operation { ActiveCheck = 0, CheckAll, CheckSelected, Switch };

[[nodiscard]] std::string_view operation_to_string(Operation operation);

struct ActiveChecked {
  bool has_active = false;
  bool user_initiated = false;
  std::string id;
  std::string fingerprint;
  double ratio = pool::RATIO_FAILED;
  std::optional<usage::UsageInfo> info;
  bool refreshed = false;
  /// Set for user-initiated checks at or above the alert threshold.
  bool quota_alert = false;
};

struct CredentialCheck {
  std::string id;
  double ratio = pool::RATIO_FAILED;
  pool::CredentialStatus status = pool::CredentialStatus::Active;
};

struct PoolChecked {
  bool selected = false;
  std::vector<CredentialCheck> results;
  std::vector<std::string> missing;
};

struct SwitchFinished {
  pool::SwitchResult result;
  bool automatic = false;
};

struct OperationFailed {
  Operation operation = Operation::ActiveCheck;
  std::string message;
};

using CoordinatorEvent = std::variant<ActiveChecked, PoolChecked, SwitchFinished, OperationFailed>;

struct ShutdownReport {
  std::string id;
  double ratio = pool::RATIO_FAILED;
  bool refreshed = false;
  bool pool_updated = false;
};

/// Owns the single-flight gates and runs each admitted operation on its own
/// worker thread. Results come back through an event queue the owner drains.
///
/// Conflicts: a busy gate drops its own requests; Switch additionally refuses
/// while CheckAll or CheckSelected runs, and both of those refuse while Switch runs.
class Coordinator {
public:
  Coordinator(std::shared_ptr<pool::CredentialStore> store,
              std::shared_ptr<usage::UsageOracle> oracle,
              std::shared_ptr<pool::FailoverEngine> engine, config::Config config);
  ~Coordinator();

  Coordinator(const Coordinator &) = delete;
  Coordinator &operator=(const Coordinator &) = delete;

  /// Each returns false when the request was dropped by a gate.
  bool check_active(bool user_initiated);
  bool check_all();
  bool check_selected(std::vector<std::string> ids);
  bool switch_to(std::string id, pool::ConfirmFn confirm);
  bool auto_failover();
  bool on_payment_error(const std::string &source);

  /// Final synchronous query of the Active credential with the shutdown
  /// timeout; persists refreshed tokens and updates the pool entry sharing its id.
  [[nodiscard]] common::Result<ShutdownReport> shutdown_sync();

  [[nodiscard]] bool busy(Operation operation) const;
  [[nodiscard]] std::vector<CoordinatorEvent> drain_events();
  [[nodiscard]] std::optional<CoordinatorEvent> wait_event(std::chrono::milliseconds timeout);

  /// Block until every gate is idle.
  void wait_idle();

private:
  class Lease {
  public:
    Lease() = default;
    Lease(Coordinator *owner, Operation operation) : owner_(owner), operation_(operation) {}
    Lease(Lease &&other) noexcept;
    Lease &operator=(Lease &&other) noexcept;
    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;
    ~Lease() { release(); }

    void release();
    [[nodiscard]] bool held() const { return owner_ != nullptr; }
    [[nodiscard]] Operation operation() const { return operation_; }

  private:
    Coordinator *owner_ = nullptr;
    Operation operation_ = Operation::ActiveCheck;
  };

  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  [[nodiscard]] Lease try_acquire(Operation operation);
  void release(Operation operation);
  void spawn(Lease lease, std::function<void()> body);
  void reap_finished_locked();
  void push_event(CoordinatorEvent event);

  void run_check_active(bool user_initiated);
  void run_pool_check(const std::vector<std::string> &ids, bool selected);
  void run_switch(const std::optional<std::string> &id, const pool::ConfirmFn &confirm);
  [[nodiscard]] common::Status persist_refreshed(const pool::Credential &snapshot,
                                                 const usage::TokenPair &tokens);

  std::shared_ptr<pool::CredentialStore> store_;
  std::shared_ptr<usage::UsageOracle> oracle_;
  std::shared_ptr<pool::FailoverEngine> engine_;
  config::Config config_;

  mutable std::mutex gate_mutex_;
  std::condition_variable idle_cv_;
  std::array<bool, 4> running_{};
  bool closing_ = false;

  std::mutex event_mutex_;
  std::condition_variable event_cv_;
  std::deque<CoordinatorEvent> events_;

  std::mutex workers_mutex_;
  std::list<Worker> workers_;
};

} // namespace quotaswap::monitor

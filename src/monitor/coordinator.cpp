#include "quotaswap/monitor/coordinator.hpp"

#include "quotaswap/observability/global.hpp"
#include "quotaswap/security/fingerprint.hpp"

#include <algorithm>
#include <unordered_set>

namespace quotaswap::monitor {

namespace {

std::size_t gate_index(const Operation operation) { return static_cast<std::size_t>(operation); }

bool same_credential(const pool::Credential &a, const pool::Credential &b) {
  if (!a.id.empty() && !b.id.empty()) {
    return a.id == b.id;
  }
  return !a.refresh_token.empty() && a.refresh_token == b.refresh_token;
}

} // namespace

std::string_view operation_to_string(const Operation operation) {
  switch (operation) {
  case Operation::ActiveCheck:
    return "active_check";
  case Operation::CheckAll:
    return "check_all";
  case Operation::CheckSelected:
    return "check_selected";
  case Operation::Switch:
    return "switch";
  }
  return "unknown";
}

Coordinator::Lease::Lease(Lease &&other) noexcept
    : owner_(other.owner_), operation_(other.operation_) {
  other.owner_ = nullptr;
}

Coordinator::Lease &Coordinator::Lease::operator=(Lease &&other) noexcept {
  if (this != &other) {
    release();
    owner_ = other.owner_;
    operation_ = other.operation_;
    other.owner_ = nullptr;
  }
  return *this;
}

void Coordinator::Lease::release() {
  if (owner_ != nullptr) {
    owner_->release(operation_);
    owner_ = nullptr;
  }
}

Coordinator::Coordinator(std::shared_ptr<pool::CredentialStore> store,
                         std::shared_ptr<usage::UsageOracle> oracle,
                         std::shared_ptr<pool::FailoverEngine> engine, config::Config config)
    : store_(std::move(store)), oracle_(std::move(oracle)), engine_(std::move(engine)),
      config_(std::move(config)) {}

Coordinator::~Coordinator() {
  {
    std::lock_guard<std::mutex> lock(gate_mutex_);
    closing_ = true;
  }
  // Workers may still be spawning follow-ups admitted before closing; keep
  // joining until the list stays empty.
  while (true) {
    std::list<Worker> batch;
    {
      std::lock_guard<std::mutex> lock(workers_mutex_);
      batch.swap(workers_);
    }
    if (batch.empty()) {
      break;
    }
    for (auto &worker : batch) {
      if (worker.thread.joinable()) {
        worker.thread.join();
      }
    }
  }
}

Coordinator::Lease Coordinator::try_acquire(const Operation operation) {
  std::lock_guard<std::mutex> lock(gate_mutex_);
  if (closing_ || running_[gate_index(operation)]) {
    return {};
  }
  const bool checks_running =
      running_[gate_index(Operation::CheckAll)] || running_[gate_index(Operation::CheckSelected)];
  const bool switch_running = running_[gate_index(Operation::Switch)];
  if (operation == Operation::Switch && checks_running) {
    return {};
  }
  if ((operation == Operation::CheckAll || operation == Operation::CheckSelected) &&
      switch_running) {
    return {};
  }
  running_[gate_index(operation)] = true;
  return Lease(this, operation);
}

void Coordinator::release(const Operation operation) {
  {
    std::lock_guard<std::mutex> lock(gate_mutex_);
    running_[gate_index(operation)] = false;
  }
  idle_cv_.notify_all();
}

bool Coordinator::busy(const Operation operation) const {
  std::lock_guard<std::mutex> lock(gate_mutex_);
  return running_[gate_index(operation)];
}

void Coordinator::wait_idle() {
  std::unique_lock<std::mutex> lock(gate_mutex_);
  idle_cv_.wait(lock, [this] {
    return std::none_of(running_.begin(), running_.end(), [](const bool busy) { return busy; });
  });
}

void Coordinator::reap_finished_locked() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load()) {
      if (it->thread.joinable()) {
        it->thread.join();
      }
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

void Coordinator::spawn(Lease lease, std::function<void()> body) {
  auto done = std::make_shared<std::atomic<bool>>(false);
  std::lock_guard<std::mutex> lock(workers_mutex_);
  reap_finished_locked();
  workers_.push_back(Worker{
      .thread = std::thread([this, lease = std::move(lease), body = std::move(body),
                             done]() mutable {
        try {
          body();
        } catch (const std::exception &e) {
          const std::string component(operation_to_string(lease.operation()));
          observability::record_error(component, e.what());
          push_event(OperationFailed{.operation = lease.operation(), .message = e.what()});
        }
        lease.release();
        done->store(true);
      }),
      .done = done});
}

void Coordinator::push_event(CoordinatorEvent event) {
  {
    std::lock_guard<std::mutex> lock(event_mutex_);
    events_.push_back(std::move(event));
  }
  event_cv_.notify_all();
}

std::vector<CoordinatorEvent> Coordinator::drain_events() {
  std::lock_guard<std::mutex> lock(event_mutex_);
  std::vector<CoordinatorEvent> drained(std::make_move_iterator(events_.begin()),
                                        std::make_move_iterator(events_.end()));
  events_.clear();
  return drained;
}

std::optional<CoordinatorEvent> Coordinator::wait_event(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(event_mutex_);
  if (!event_cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
    return std::nullopt;
  }
  CoordinatorEvent event = std::move(events_.front());
  events_.pop_front();
  return event;
}

bool Coordinator::check_active(const bool user_initiated) {
  auto lease = try_acquire(Operation::ActiveCheck);
  if (!lease.held()) {
    return false;
  }
  spawn(std::move(lease), [this, user_initiated] { run_check_active(user_initiated); });
  return true;
}

bool Coordinator::check_all() {
  auto lease = try_acquire(Operation::CheckAll);
  if (!lease.held()) {
    return false;
  }
  spawn(std::move(lease), [this] { run_pool_check({}, false); });
  return true;
}

bool Coordinator::check_selected(std::vector<std::string> ids) {
  auto lease = try_acquire(Operation::CheckSelected);
  if (!lease.held()) {
    return false;
  }
  spawn(std::move(lease), [this, ids = std::move(ids)] { run_pool_check(ids, true); });
  return true;
}

bool Coordinator::switch_to(std::string id, pool::ConfirmFn confirm) {
  auto lease = try_acquire(Operation::Switch);
  if (!lease.held()) {
    return false;
  }
  spawn(std::move(lease), [this, id = std::move(id), confirm = std::move(confirm)] {
    run_switch(id, confirm);
  });
  return true;
}

bool Coordinator::auto_failover() {
  auto lease = try_acquire(Operation::Switch);
  if (!lease.held()) {
    return false;
  }
  spawn(std::move(lease), [this] { run_switch(std::nullopt, nullptr); });
  return true;
}

bool Coordinator::on_payment_error(const std::string &source) {
  const bool admitted = auto_failover();
  if (!admitted) {
    observability::record_error("payment_error", "failover already running; ignored report from " +
                                                     source);
  }
  return admitted;
}

common::Status Coordinator::persist_refreshed(const pool::Credential &snapshot,
                                              const usage::TokenPair &tokens) {
  if (auto current = store_->load_active(); current.has_value() && same_credential(*current, snapshot)) {
    current->access_token = tokens.access_token;
    current->refresh_token = tokens.refresh_token;
    return store_->save_active(*current);
  }

  // The Active slot moved on while we were querying; the snapshot now lives in the pool.
  auto reserve = store_->load_reserve();
  pool::Credential *entry = pool::find_by_id(reserve, snapshot.id);
  if (entry == nullptr) {
    entry = pool::find_by_refresh_token(reserve, snapshot.refresh_token);
  }
  if (entry == nullptr) {
    return common::Status::error("refreshed tokens for " + snapshot.id +
                                 " have no credential left to land in");
  }
  entry->access_token = tokens.access_token;
  entry->refresh_token = tokens.refresh_token;
  return store_->save_reserve(reserve);
}

void Coordinator::run_check_active(const bool user_initiated) {
  ActiveChecked event;
  event.user_initiated = user_initiated;

  const auto snapshot = store_->load_active();
  if (!snapshot.has_value()) {
    push_event(std::move(event));
    return;
  }

  event.has_active = true;
  event.id = snapshot->id;
  event.fingerprint = security::token_fingerprint(snapshot->access_token, snapshot->refresh_token);

  const auto report = oracle_->query(snapshot->access_token, snapshot->refresh_token,
                                     static_cast<std::uint64_t>(config_.remote.timeout_ms));
  event.ratio = report.ratio;
  event.info = report.info;

  if (report.refreshed.has_value()) {
    const auto saved = persist_refreshed(*snapshot, *report.refreshed);
    if (saved.ok()) {
      event.refreshed = true;
      observability::record_tokens_refreshed(
          snapshot->id, security::token_fingerprint(report.refreshed->access_token,
                                                    report.refreshed->refresh_token));
    } else {
      observability::record_error("active_check", saved.error());
      push_event(OperationFailed{.operation = Operation::ActiveCheck, .message = saved.error()});
    }
  }

  observability::record_usage_checked(event.id, event.fingerprint, report.ratio,
                                      user_initiated ? "user" : "timer");
  event.quota_alert =
      user_initiated && report.ok() && report.ratio >= config_.failover.alert_threshold;
  push_event(std::move(event));

  if (!user_initiated && report.ok() && report.ratio >= config_.failover.exhausted_threshold &&
      config_.failover.auto_on_exhaustion) {
    auto_failover();
  }
}

void Coordinator::run_pool_check(const std::vector<std::string> &ids, const bool selected) {
  PoolChecked event;
  event.selected = selected;

  const auto active = store_->load_active();
  const std::string active_id = active.has_value() ? active->id : "";
  const auto snapshot = store_->load_reserve();
  const std::unordered_set<std::string> wanted(ids.begin(), ids.end());

  if (selected) {
    for (const auto &id : ids) {
      if (pool::find_by_id(snapshot, id) == nullptr) {
        event.missing.push_back(id);
      }
    }
  }

  for (const auto &entry : snapshot) {
    if (selected && !wanted.contains(entry.id)) {
      continue;
    }
    if (!active_id.empty() && entry.id == active_id) {
      continue;
    }

    const auto report = oracle_->query(entry.access_token, entry.refresh_token,
                                       static_cast<std::uint64_t>(config_.remote.timeout_ms));

    // Write back against a fresh load so concurrent edits survive.
    auto latest = store_->load_reserve();
    pool::Credential *target = pool::find_by_id(latest, entry.id);
    CredentialCheck result{.id = entry.id, .ratio = report.ratio};
    if (target != nullptr) {
      pool::apply_usage_report(*target, report, config_.failover.warn_threshold);
      result.status = target->status;
      if (const auto saved = store_->save_reserve(latest); !saved.ok()) {
        push_event(OperationFailed{
            .operation = selected ? Operation::CheckSelected : Operation::CheckAll,
            .message = saved.error()});
      }
    } else {
      pool::Credential scratch = entry;
      pool::apply_usage_report(scratch, report, config_.failover.warn_threshold);
      result.status = scratch.status;
    }

    if (report.refreshed.has_value()) {
      observability::record_tokens_refreshed(
          entry.id, security::token_fingerprint(report.refreshed->access_token,
                                                report.refreshed->refresh_token));
    }
    observability::record_usage_checked(
        entry.id, security::token_fingerprint(entry.access_token, entry.refresh_token),
        report.ratio, selected ? "selected" : "pool");
    event.results.push_back(std::move(result));
  }

  push_event(std::move(event));
}

void Coordinator::run_switch(const std::optional<std::string> &id,
                             const pool::ConfirmFn &confirm) {
  SwitchFinished event;
  event.automatic = !id.has_value();
  event.result = id.has_value() ? engine_->switch_to(*id, confirm) : engine_->auto_failover();
  const bool promoted = event.result.ok();
  push_event(std::move(event));

  if (promoted) {
    check_active(false);
  }
}

common::Result<ShutdownReport> Coordinator::shutdown_sync() {
  wait_idle();
  auto lease = try_acquire(Operation::Switch);
  if (!lease.held()) {
    return common::Result<ShutdownReport>::failure("a switch is in progress");
  }

  ShutdownReport report;
  auto active = store_->load_active();
  if (!active.has_value()) {
    return common::Result<ShutdownReport>::success(report);
  }
  report.id = active->id;

  const auto usage = oracle_->query(active->access_token, active->refresh_token,
                                    static_cast<std::uint64_t>(config_.remote.shutdown_timeout_ms));
  report.ratio = usage.ratio;
  if (usage.refreshed.has_value()) {
    if (const auto saved = persist_refreshed(*active, *usage.refreshed); !saved.ok()) {
      return common::Result<ShutdownReport>::failure(saved.error());
    }
    active->access_token = usage.refreshed->access_token;
    active->refresh_token = usage.refreshed->refresh_token;
    report.refreshed = true;
  }

  auto reserve = store_->load_reserve();
  if (pool::Credential *entry = pool::find_by_id(reserve, active->id); entry != nullptr) {
    entry->access_token = active->access_token;
    entry->refresh_token = active->refresh_token;
    if (usage.ok()) {
      entry->ratio = usage.ratio;
      entry->status = usage.ratio >= config_.failover.warn_threshold
                          ? pool::CredentialStatus::LowQuota
                          : pool::CredentialStatus::Active;
    }
    if (const auto saved = store_->save_reserve(reserve); !saved.ok()) {
      return common::Result<ShutdownReport>::failure(saved.error());
    }
    report.pool_updated = true;
  }

  observability::record_usage_checked(
      report.id, security::token_fingerprint(active->access_token, active->refresh_token),
      report.ratio, "shutdown");
  return common::Result<ShutdownReport>::success(report);
}

} // namespace quotaswap::monitor

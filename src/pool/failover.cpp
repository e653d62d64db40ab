#include "quotaswap/pool/failover.hpp"

#include "quotaswap/common/json_util.hpp"
#include "quotaswap/observability/global.hpp"

#include <algorithm>

namespace quotaswap::pool {

namespace {

SwitchResult make_result(const SwitchOutcome outcome, std::string id, const double ratio,
                         std::string message) {
  SwitchResult result;
  result.outcome = outcome;
  result.id = std::move(id);
  result.ratio = ratio;
  result.message = std::move(message);
  return result;
}

} // namespace

std::string_view outcome_to_string(const SwitchOutcome outcome) {
  switch (outcome) {
  case SwitchOutcome::Promoted:
    return "promoted";
  case SwitchOutcome::NoneAvailable:
    return "none_available";
  case SwitchOutcome::QueryFailed:
    return "query_failed";
  case SwitchOutcome::Exhausted:
    return "exhausted";
  case SwitchOutcome::PoolLookupMiss:
    return "pool_lookup_miss";
  case SwitchOutcome::Declined:
    return "declined";
  case SwitchOutcome::PersistFailed:
    return "persist_failed";
  }
  return "unknown";
}

std::optional<std::string> select_candidate(const CredentialList &pool,
                                            const std::string &active_id,
                                            const double warn_threshold) {
  const Credential *best = nullptr;
  double best_ratio = 0.0;

  for (const auto &entry : pool) {
    if (!active_id.empty() && entry.id == active_id) {
      continue;
    }
    const double ratio = entry.ratio.value_or(0.0);
    if (ratio >= warn_threshold) {
      continue;
    }
    if (best == nullptr || ratio < best_ratio) {
      best = &entry;
      best_ratio = ratio;
    }
  }

  if (best == nullptr) {
    return std::nullopt;
  }
  return best->id;
}

FailoverEngine::FailoverEngine(std::shared_ptr<CredentialStore> store,
                               std::shared_ptr<usage::UsageOracle> oracle,
                               config::FailoverConfig config, const std::uint64_t timeout_ms)
    : store_(std::move(store)), oracle_(std::move(oracle)), config_(config),
      timeout_ms_(timeout_ms) {}

SwitchResult FailoverEngine::auto_failover() const {
  const auto active = store_->load_active();
  const std::string active_id = active.has_value() ? active->id : "";
  const auto candidate = select_candidate(store_->load_reserve(), active_id, config_.warn_threshold);
  if (!candidate.has_value()) {
    auto result = make_result(SwitchOutcome::NoneAvailable, "", RATIO_FAILED,
                              "no usable backup credential in the pool");
    result.previous_id = active_id;
    observability::record_failover(active_id, "", std::string(outcome_to_string(result.outcome)),
                                   result.ratio, true);
    return result;
  }
  return promote(*candidate, nullptr);
}

SwitchResult FailoverEngine::switch_to(const std::string &id, const ConfirmFn &confirm) const {
  return promote(id, confirm ? &confirm : nullptr);
}

SwitchResult FailoverEngine::promote(const std::string &id, const ConfirmFn *confirm) const {
  const bool automatic = confirm == nullptr;
  const auto finish = [&](SwitchResult result) {
    observability::record_failover(result.previous_id, id,
                                   std::string(outcome_to_string(result.outcome)), result.ratio,
                                   automatic);
    return result;
  };

  // 1. Locate the candidate in a fresh pool.
  CredentialList pool = store_->load_reserve();
  const Credential *snapshot = find_by_id(pool, id);
  if (snapshot == nullptr) {
    return finish(make_result(SwitchOutcome::PoolLookupMiss, id, RATIO_FAILED,
                              "credential " + id + " is not in the pool"));
  }

  // 2. Admission check on live usage. Its side effects land before anything moves.
  const auto report = oracle_->query(snapshot->access_token, snapshot->refresh_token, timeout_ms_);
  {
    CredentialList latest = store_->load_reserve();
    if (Credential *entry = find_by_id(latest, id); entry != nullptr) {
      apply_usage_report(*entry, report, config_.warn_threshold);
      if (const auto saved = store_->save_reserve(latest); !saved.ok()) {
        return finish(make_result(SwitchOutcome::PersistFailed, id, report.ratio,
                                  "unable to record usage for " + id + ": " + saved.error()));
      }
    }
  }

  // 3. Stale pool ratios are not enough; the fresh one decides.
  if (!report.ok()) {
    return finish(make_result(SwitchOutcome::QueryFailed, id, report.ratio,
                              "usage query for " + id + " failed"));
  }
  if (report.ratio >= config_.exhausted_threshold) {
    return finish(make_result(SwitchOutcome::Exhausted, id, report.ratio,
                              "credential " + id + " has no quota left (" +
                                  format_ratio(report.ratio) + " used)"));
  }

  // 4. Interactive confirmation for manual switches.
  if (confirm != nullptr) {
    SwitchPrompt prompt;
    prompt.id = id;
    prompt.used_ratio = report.ratio;
    prompt.remaining_ratio = std::max(0.0, 1.0 - report.ratio);
    prompt.info = report.info;
    if (!(*confirm)(prompt)) {
      return finish(make_result(SwitchOutcome::Declined, id, report.ratio,
                                "switch to " + id + " cancelled"));
    }
  }

  // 5. Commit: Active first, then one pool write with removal and demotion.
  pool = store_->load_reserve();
  const auto it = std::find_if(pool.begin(), pool.end(),
                               [&](const Credential &entry) { return entry.id == id; });
  if (it == pool.end()) {
    return finish(make_result(SwitchOutcome::PoolLookupMiss, id, report.ratio,
                              "credential " + id + " left the pool during the switch"));
  }
  const Credential candidate = *it;
  const auto previous = store_->load_active();

  if (const auto saved = store_->save_active(candidate); !saved.ok()) {
    return finish(make_result(SwitchOutcome::PersistFailed, id, report.ratio,
                              "unable to write the active credential: " + saved.error()));
  }

  pool.erase(it);
  std::string previous_id;
  if (previous.has_value()) {
    const bool same_credential =
        (!previous->id.empty() && previous->id == candidate.id) ||
        (!previous->refresh_token.empty() && previous->refresh_token == candidate.refresh_token);
    if (!same_credential) {
      previous_id = demote_into_pool(pool, *previous);
    }
  }

  if (const auto saved = store_->save_reserve(pool); !saved.ok()) {
    auto result = make_result(SwitchOutcome::PersistFailed, id, report.ratio,
                              "active credential switched but the pool could not be saved: " +
                                  saved.error());
    result.previous_id = previous_id;
    return finish(std::move(result));
  }

  auto result = make_result(SwitchOutcome::Promoted, id, report.ratio,
                            "switched to " + id + " (" + format_ratio(report.ratio) + " used)");
  result.previous_id = previous_id;
  return finish(std::move(result));
}

} // namespace quotaswap::pool

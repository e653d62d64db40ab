#pragma once

#include "quotaswap/config/schema.hpp"
#include "quotaswap/pool/store.hpp"
#include "quotaswap/usage/oracle.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace quotaswap::pool {

enum class SwitchOutcome {
  Promoted,
  NoneAvailable,
  QueryFailed,
  Exhausted,
  PoolLookupMiss,
  Declined,
  PersistFailed,
};

[[nodiscard]] std::string_view outcome_to_string(SwitchOutcome outcome);

struct SwitchResult {
  SwitchOutcome outcome = SwitchOutcome::NoneAvailable;
  std::string id;
  std::string previous_id;
  double ratio = RATIO_FAILED;
  std::string message;

  [[nodiscard]] bool ok() const { return outcome == SwitchOutcome::Promoted; }
};

/// What a manual switch shows the user before committing.
struct SwitchPrompt {
  std::string id;
  double used_ratio = 0.0;
  double remaining_ratio = 0.0;
  std::optional<usage::UsageInfo> info;
};

using ConfirmFn = std::function<bool(const SwitchPrompt &)>;

/// Id of the best failover candidate: not the Active one, ratio below
/// `warn_threshold` (unset counts as 0), lowest ratio first, pool order on ties.
[[nodiscard]] std::optional<std::string> select_candidate(const CredentialList &pool,
                                                          const std::string &active_id,
                                                          double warn_threshold);

/// Promotes reserve credentials to Active. Callers serialize calls; the
/// coordinator's Switch gate does that in the running program.
class FailoverEngine {
public:
  FailoverEngine(std::shared_ptr<CredentialStore> store,
                 std::shared_ptr<usage::UsageOracle> oracle, config::FailoverConfig config,
                 std::uint64_t timeout_ms);

  [[nodiscard]] SwitchResult auto_failover() const;
  [[nodiscard]] SwitchResult switch_to(const std::string &id, const ConfirmFn &confirm) const;

private:
  [[nodiscard]] SwitchResult promote(const std::string &id, const ConfirmFn *confirm) const;

  std::shared_ptr<CredentialStore> store_;
  std::shared_ptr<usage::UsageOracle> oracle_;
  config::FailoverConfig config_;
  std::uint64_t timeout_ms_;
};

} // namespace quotaswap::pool

#pragma once

#include "quotaswap/common/json_util.hpp"
#include "quotaswap/usage/oracle.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quotaswap::pool {

enum class CredentialStatus { Active, LowQuota, Invalid };

[[nodiscard]] std::string_view status_to_string(CredentialStatus status);

/// Unknown values read as Active. Accepts the legacy localized labels too.
[[nodiscard]] CredentialStatus status_from_string(const std::string &value);

inline constexpr double RATIO_FAILED = -1.0;

struct Credential {
  std::string id;
  std::string access_token;
  std::string refresh_token;
  CredentialStatus status = CredentialStatus::Active;
  /// Unset (never queried), a value in [0, 1], or RATIO_FAILED.
  std::optional<double> ratio;
  /// Members this program does not own, preserved in document order.
  common::JsonFields extra;
};

/// Parse one pool entry. nullopt unless `raw` is a JSON object.
[[nodiscard]] std::optional<Credential> credential_from_json(const std::string &raw);
[[nodiscard]] std::string credential_to_json(const Credential &credential, std::size_t indent = 0);

/// Read a string or numeric member as text (legacy ids were numbers).
[[nodiscard]] std::string text_member(const common::JsonFields &fields, const std::string &key);

/// "42.5%" for a ratio; "failed" for RATIO_FAILED.
[[nodiscard]] std::string format_ratio(double ratio);

using CredentialList = std::vector<Credential>;

[[nodiscard]] Credential *find_by_id(CredentialList &pool, const std::string &id);
[[nodiscard]] const Credential *find_by_id(const CredentialList &pool, const std::string &id);
[[nodiscard]] Credential *find_by_refresh_token(CredentialList &pool,
                                                const std::string &refresh_token);
[[nodiscard]] const Credential *find_by_refresh_token(const CredentialList &pool,
                                                      const std::string &refresh_token);

/// A millisecond-timestamp id not used by any entry of `pool`.
[[nodiscard]] std::string mint_id(const CredentialList &pool, std::int64_t base_ms);

/// Fold a usage report into a pool entry: refreshed tokens, ratio and status.
/// A failed query marks the entry invalid with ratio -1.
void apply_usage_report(Credential &entry, const usage::UsageReport &report,
                        double warn_threshold);

/// Put the previous Active back into the pool: merge its tokens into the entry
/// sharing its id (or refresh token), otherwise insert it at the front as active.
/// An empty id is first resolved by refresh token, else minted. Returns the id used.
std::string demote_into_pool(CredentialList &pool, Credential previous);

} // namespace quotaswap::pool

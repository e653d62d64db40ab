#pragma once

#include "quotaswap/usage/remote.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace quotaswap::usage {

/// Outcome of one oracle query. `ratio` is -1 when usage could not be read.
/// `refreshed` is set whenever a refresh succeeded, even if the retried
/// usage query then failed; callers must persist it.
struct UsageReport {
  double ratio = -1.0;
  std::optional<UsageInfo> info;
  std::optional<TokenPair> refreshed;

  [[nodiscard]] bool ok() const { return ratio >= 0.0; }
};

class UsageOracle {
public:
  explicit UsageOracle(std::shared_ptr<RemoteApi> remote);

  /// Query usage with `access_token`; on failure refresh once and retry once.
  [[nodiscard]] UsageReport query(const std::string &access_token,
                                  const std::string &refresh_token,
                                  std::uint64_t timeout_ms) const;

private:
  std::shared_ptr<RemoteApi> remote_;
};

} // namespace quotaswap::usage

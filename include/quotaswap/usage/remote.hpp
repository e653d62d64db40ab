#pragma once

#include "quotaswap/common/result.hpp"
#include "quotaswap/config/schema.hpp"
#include "quotaswap/usage/http.hpp"

#include <memory>
#include <string>

namespace quotaswap::usage {

struct TokenPair {
  std::string access_token;
  std::string refresh_token;
};

/// Absolute token counts reported by the usage endpoint.
struct UsageInfo {
  double total = 0.0;
  double used = 0.0;
  double remain = 0.0;
};

struct UsageSample {
  double ratio = 0.0;
  UsageInfo info;
};

/// The two remote calls the pool depends on.
class RemoteApi {
public:
  virtual ~RemoteApi() = default;

  /// Exchange a refresh token. The new refresh token falls back to the one supplied.
  [[nodiscard]] virtual common::Result<TokenPair> refresh(const std::string &refresh_token,
                                                          std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual common::Result<UsageSample> query_usage(const std::string &access_token,
                                                                std::uint64_t timeout_ms) = 0;
};

class HttpRemoteApi final : public RemoteApi {
public:
  explicit HttpRemoteApi(config::RemoteConfig config,
                         std::shared_ptr<HttpClient> http = std::make_shared<CurlHttpClient>());

  [[nodiscard]] common::Result<TokenPair> refresh(const std::string &refresh_token,
                                                  std::uint64_t timeout_ms) override;
  [[nodiscard]] common::Result<UsageSample> query_usage(const std::string &access_token,
                                                        std::uint64_t timeout_ms) override;

private:
  config::RemoteConfig config_;
  std::shared_ptr<HttpClient> http_;
};

[[nodiscard]] std::string url_encode_component(const std::string &value);

/// Parse a usage response body: `{"usage": {"standard": {"totalAllowance", "orgTotalTokensUsed"}}}`.
[[nodiscard]] common::Result<UsageSample> parse_usage_body(const std::string &body);

} // namespace quotaswap::usage

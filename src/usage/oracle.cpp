#include "quotaswap/usage/oracle.hpp"

#include "quotaswap/observability/global.hpp"

namespace quotaswap::usage {

namespace {

UsageReport from_sample(const UsageSample &sample) {
  UsageReport report;
  report.ratio = sample.ratio;
  report.info = sample.info;
  return report;
}

} // namespace

UsageOracle::UsageOracle(std::shared_ptr<RemoteApi> remote) : remote_(std::move(remote)) {}

UsageReport UsageOracle::query(const std::string &access_token, const std::string &refresh_token,
                               const std::uint64_t timeout_ms) const {
  if (!access_token.empty()) {
    const auto first = remote_->query_usage(access_token, timeout_ms);
    if (first.ok()) {
      return from_sample(first.value());
    }
  }

  UsageReport failed;
  if (refresh_token.empty()) {
    return failed;
  }

  const auto refreshed = remote_->refresh(refresh_token, timeout_ms);
  if (!refreshed.ok()) {
    observability::record_error("usage", refreshed.error());
    return failed;
  }
  failed.refreshed = refreshed.value();

  const auto retry = remote_->query_usage(refreshed.value().access_token, timeout_ms);
  if (!retry.ok()) {
    observability::record_error("usage", retry.error());
    return failed;
  }

  UsageReport report = from_sample(retry.value());
  report.refreshed = refreshed.value();
  return report;
}

} // namespace quotaswap::usage

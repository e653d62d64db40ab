#include "quotaswap/usage/remote.hpp"

#include "quotaswap/common/fs.hpp"
#include "quotaswap/common/json_util.hpp"
#include "quotaswap/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace quotaswap::usage {

namespace {

constexpr const char *USAGE_USER_AGENT = "Mozilla/5.0";

std::string string_field(const common::JsonFields &fields, const std::string &key) {
  const std::string *raw = common::json_find_field(fields, key);
  if (raw == nullptr) {
    return "";
  }
  return common::trim(common::json_string_value(*raw).value_or(""));
}

double number_field(const common::JsonFields &fields, const std::string &key) {
  const std::string *raw = common::json_find_field(fields, key);
  if (raw == nullptr) {
    return 0.0;
  }
  return common::json_number_value(*raw).value_or(0.0);
}

class LatencyTimer {
public:
  explicit LatencyTimer(std::string endpoint)
      : endpoint_(std::move(endpoint)), started_(std::chrono::steady_clock::now()) {}

  ~LatencyTimer() {
    observability::record_remote_latency(
        endpoint_, std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - started_));
  }

private:
  std::string endpoint_;
  std::chrono::steady_clock::time_point started_;
};

} // namespace

std::string url_encode_component(const std::string &value) {
  std::ostringstream encoded;
  for (const unsigned char ch : value) {
    if ((ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') ||
        ch == '-' || ch == '_' || ch == '.' || ch == '~') {
      encoded << static_cast<char>(ch);
    } else {
      encoded << '%';
      encoded << "0123456789ABCDEF"[ch >> 4];
      encoded << "0123456789ABCDEF"[ch & 0x0F];
    }
  }
  return encoded.str();
}

common::Result<UsageSample> parse_usage_body(const std::string &body) {
  const auto root = common::json_object_fields(body);
  if (!root.has_value()) {
    return common::Result<UsageSample>::failure("usage response is not a JSON object");
  }
  const std::string *usage_raw = common::json_find_field(*root, "usage");
  if (usage_raw == nullptr) {
    return common::Result<UsageSample>::failure("usage response has no 'usage' member");
  }

  common::JsonFields standard;
  if (const auto usage = common::json_object_fields(*usage_raw); usage.has_value()) {
    if (const std::string *standard_raw = common::json_find_field(*usage, "standard");
        standard_raw != nullptr) {
      standard = common::json_object_fields(*standard_raw).value_or(common::JsonFields{});
    }
  }

  UsageSample sample;
  sample.info.total = number_field(standard, "totalAllowance");
  sample.info.used = number_field(standard, "orgTotalTokensUsed");
  sample.info.remain = sample.info.total - sample.info.used;
  sample.ratio = sample.info.total > 0.0 ? sample.info.used / sample.info.total : 0.0;
  sample.ratio = std::clamp(sample.ratio, 0.0, 1.0);
  return common::Result<UsageSample>::success(sample);
}

HttpRemoteApi::HttpRemoteApi(config::RemoteConfig config, std::shared_ptr<HttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {}

common::Result<TokenPair> HttpRemoteApi::refresh(const std::string &refresh_token,
                                                 const std::uint64_t timeout_ms) {
  std::string body = "grant_type=refresh_token";
  body += "&refresh_token=" + url_encode_component(refresh_token);
  body += "&client_id=" + url_encode_component(config_.client_id);

  HttpResponse response;
  {
    LatencyTimer timer("refresh");
    response = http_->post_form(config_.refresh_url,
                                {{"Content-Type", "application/x-www-form-urlencoded"}}, body,
                                timeout_ms);
  }

  if (response.network_error) {
    return common::Result<TokenPair>::failure(
        std::string(response.timeout ? "timeout" : "network error") +
        " refreshing token: " + response.network_error_message);
  }

  // The identity provider reports some failures with a 2xx and vice versa;
  // only the presence of a new access token decides.
  const auto fields = common::json_object_fields(response.body);
  if (!fields.has_value()) {
    return common::Result<TokenPair>::failure("token refresh failed (HTTP " +
                                              std::to_string(response.status) +
                                              "): response is not a JSON object");
  }

  TokenPair tokens;
  tokens.access_token = string_field(*fields, "access_token");
  tokens.refresh_token = string_field(*fields, "refresh_token");
  if (tokens.access_token.empty()) {
    return common::Result<TokenPair>::failure("token refresh failed (HTTP " +
                                              std::to_string(response.status) +
                                              "): no access_token returned");
  }
  if (tokens.refresh_token.empty()) {
    tokens.refresh_token = refresh_token;
  }
  return common::Result<TokenPair>::success(std::move(tokens));
}

common::Result<UsageSample> HttpRemoteApi::query_usage(const std::string &access_token,
                                                       const std::uint64_t timeout_ms) {
  HttpResponse response;
  {
    LatencyTimer timer("usage");
    response = http_->get(config_.usage_url,
                          {{"Authorization", "Bearer " + access_token},
                           {"User-Agent", USAGE_USER_AGENT}},
                          timeout_ms);
  }

  if (response.network_error) {
    return common::Result<UsageSample>::failure(
        std::string(response.timeout ? "timeout" : "network error") +
        " querying usage: " + response.network_error_message);
  }
  if (!response.success()) {
    return common::Result<UsageSample>::failure("usage query failed (HTTP " +
                                                std::to_string(response.status) + ")");
  }
  return parse_usage_body(response.body);
}

} // namespace quotaswap::usage

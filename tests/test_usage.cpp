#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "quotaswap/usage/oracle.hpp"
#include "quotaswap/usage/remote.hpp"

#include <cmath>

namespace {

quotaswap::config::RemoteConfig remote_config() {
  quotaswap::config::RemoteConfig config;
  config.client_id = "client_test";
  config.refresh_url = "https://auth.example.test/token";
  config.usage_url = "https://api.example.test/usage";
  return config;
}

bool near(const double a, const double b) { return std::fabs(a - b) < 1e-9; }

} // namespace

void register_usage_tests(std::vector<quotaswap::tests::TestCase> &tests) {
  using quotaswap::tests::require;
  namespace usage = quotaswap::usage;
  namespace qt = quotaswap::testing;

  tests.push_back({"usage_parse_body_ratio", [] {
                     const auto sample = usage::parse_usage_body(
                         R"({"usage":{"standard":{"totalAllowance":20000000,"orgTotalTokensUsed":5000000}}})");
                     require(sample.ok(), "parse failed");
                     require(near(sample.value().ratio, 0.25), "ratio should be 0.25");
                     require(near(sample.value().info.remain, 15000000), "remain mismatch");
                   }});

  tests.push_back({"usage_parse_body_edge_cases", [] {
                     const auto zero = usage::parse_usage_body(
                         R"({"usage":{"standard":{"totalAllowance":0,"orgTotalTokensUsed":10}}})");
                     require(zero.ok() && zero.value().ratio == 0.0, "zero allowance reads as 0");

                     const auto over = usage::parse_usage_body(
                         R"({"usage":{"standard":{"totalAllowance":100,"orgTotalTokensUsed":150}}})");
                     require(over.ok() && over.value().ratio == 1.0, "overuse clamps to 1");

                     const auto no_standard = usage::parse_usage_body(R"({"usage":{}})");
                     require(no_standard.ok() && no_standard.value().ratio == 0.0,
                             "missing standard block counts as zero");

                     require(!usage::parse_usage_body(R"({"other":1})").ok(), "missing usage member");
                     require(!usage::parse_usage_body("<html>").ok(), "non-JSON body");
                   }});

  tests.push_back({"usage_url_encode_component", [] {
                     require(usage::url_encode_component("a b/c+d~") == "a%20b%2Fc%2Bd~",
                             "url encoding mismatch");
                   }});

  tests.push_back({"usage_remote_query_sends_bearer_and_agent", [] {
                     auto http = std::make_shared<qt::MockHttpClient>();
                     http->push_response(qt::http_response(
                         200, R"({"usage":{"standard":{"totalAllowance":10,"orgTotalTokensUsed":4}}})"));
                     usage::HttpRemoteApi api(remote_config(), http);
                     const auto sample = api.query_usage("at-1", 1000);
                     require(sample.ok() && near(sample.value().ratio, 0.4), "query failed");
                     const auto &request = http->requests().at(0);
                     require(request.method == "GET", "usage must be a GET");
                     require(request.url == "https://api.example.test/usage", "usage url");
                     require(request.headers.at("Authorization") == "Bearer at-1", "bearer header");
                     require(request.headers.at("User-Agent") == "Mozilla/5.0", "user agent");
                   }});

  tests.push_back({"usage_remote_query_rejects_non_2xx_and_network_errors", [] {
                     auto http = std::make_shared<qt::MockHttpClient>();
                     http->push_response(qt::http_response(401, R"({"error":"expired"})"));
                     usage::HttpResponse timeout;
                     timeout.network_error = true;
                     timeout.timeout = true;
                     timeout.network_error_message = "Operation timed out";
                     http->push_response(timeout);
                     usage::HttpRemoteApi api(remote_config(), http);

                     const auto unauthorized = api.query_usage("at", 1000);
                     require(!unauthorized.ok(), "401 should fail");
                     require(unauthorized.error().find("401") != std::string::npos,
                             "status missing from error");
                     const auto timed_out = api.query_usage("at", 1000);
                     require(!timed_out.ok() && timed_out.error().find("timeout") != std::string::npos,
                             "timeout should be reported");
                   }});

  tests.push_back({"usage_remote_refresh_posts_form", [] {
                     auto http = std::make_shared<qt::MockHttpClient>();
                     http->push_response(
                         qt::http_response(200, R"({"access_token":"at-new","refresh_token":"rt-new"})"));
                     usage::HttpRemoteApi api(remote_config(), http);
                     const auto tokens = api.refresh("rt old", 1000);
                     require(tokens.ok(), "refresh failed");
                     require(tokens.value().access_token == "at-new", "access token");
                     require(tokens.value().refresh_token == "rt-new", "refresh token");
                     const auto &request = http->requests().at(0);
                     require(request.method == "POST", "refresh must be a POST");
                     require(request.body ==
                                 "grant_type=refresh_token&refresh_token=rt%20old&client_id=client_test",
                             "form body mismatch: " + request.body);
                   }});

  tests.push_back({"usage_remote_refresh_body_decides", [] {
                     auto http = std::make_shared<qt::MockHttpClient>();
                     http->push_response(qt::http_response(400, R"({"access_token":"at-odd"})"));
                     http->push_response(qt::http_response(200, R"({"error":"invalid_grant"})"));
                     usage::HttpRemoteApi api(remote_config(), http);

                     const auto odd = api.refresh("rt-keep", 1000);
                     require(odd.ok(), "an access token in a non-2xx body still counts");
                     require(odd.value().refresh_token == "rt-keep",
                             "missing refresh token falls back to the old one");
                     require(!api.refresh("rt-keep", 1000).ok(),
                             "2xx without access token must fail");
                   }});

  tests.push_back({"oracle_first_query_succeeds_without_refresh", [] {
                     auto remote = std::make_shared<qt::MockRemoteApi>();
                     remote->set_usage("at", 0.3);
                     usage::UsageOracle oracle(remote);
                     const auto report = oracle.query("at", "rt", 1000);
                     require(report.ok() && near(report.ratio, 0.3), "ratio");
                     require(!report.refreshed.has_value(), "no refresh expected");
                     require(remote->refresh_calls() == 0, "refresh should not be called");
                   }});

  tests.push_back({"oracle_expired_token_refreshes_then_retries", [] {
                     auto remote = std::make_shared<qt::MockRemoteApi>();
                     remote->set_refresh("rt", {.access_token = "at-new", .refresh_token = "rt-new"});
                     remote->set_usage("at-new", 0.5);
                     usage::UsageOracle oracle(remote);
                     const auto report = oracle.query("at-expired", "rt", 1000);
                     require(report.ok() && near(report.ratio, 0.5), "retry should succeed");
                     require(report.refreshed.has_value() &&
                                 report.refreshed->refresh_token == "rt-new",
                             "refreshed tokens must be surfaced");
                     require(remote->usage_calls() == 2 && remote->refresh_calls() == 1,
                             "exactly one refresh and one retry");
                   }});

  tests.push_back({"oracle_keeps_refresh_when_retry_fails", [] {
                     auto remote = std::make_shared<qt::MockRemoteApi>();
                     remote->set_refresh("rt", {.access_token = "at-new", .refresh_token = "rt-new"});
                     usage::UsageOracle oracle(remote);
                     const auto report = oracle.query("at", "rt", 1000);
                     require(!report.ok() && report.ratio == -1.0, "query should fail");
                     require(report.refreshed.has_value() && report.refreshed->access_token == "at-new",
                             "refreshed tokens survive a failed retry");
                   }});

  tests.push_back({"oracle_without_tokens_fails_quietly", [] {
                     auto remote = std::make_shared<qt::MockRemoteApi>();
                     usage::UsageOracle oracle(remote);
                     const auto no_refresh = oracle.query("at", "", 1000);
                     require(!no_refresh.ok() && !no_refresh.refreshed.has_value(),
                             "failure without refresh token");
                     require(remote->refresh_calls() == 0, "no refresh without a refresh token");

                     const auto no_access = oracle.query("", "rt-unknown", 1000);
                     require(!no_access.ok(), "refresh failure should fail the query");
                     require(remote->usage_calls() == 1, "empty access token skips the first query");
                   }});
}

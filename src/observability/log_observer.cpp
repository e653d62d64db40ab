#include "quotaswap/observability/log_observer.hpp"

#include "quotaswap/common/json_util.hpp"

#include <iostream>
#include <type_traits>

namespace quotaswap::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string ratio_text(const double ratio) {
  return ratio < 0.0 ? std::string("failed") : common::json_number(ratio);
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, UsageCheckedEvent>) {
          log_line(evt.ratio < 0.0 ? "WARN" : "INFO",
                   "usage.checked id=" + evt.credential_id + " fp=" + evt.fingerprint +
                       " ratio=" + ratio_text(evt.ratio) + " trigger=" + evt.trigger);
        } else if constexpr (std::is_same_v<T, TokensRefreshedEvent>) {
          log_line("INFO", "tokens.refreshed id=" + evt.credential_id + " fp=" + evt.fingerprint);
        } else if constexpr (std::is_same_v<T, FailoverEvent>) {
          log_line(evt.outcome == "promoted" ? "INFO" : "WARN",
                   std::string(evt.automatic ? "failover.auto" : "failover.manual") +
                       " outcome=" + evt.outcome + " from=" + evt.from_id + " to=" + evt.to_id +
                       " ratio=" + ratio_text(evt.ratio));
        } else if constexpr (std::is_same_v<T, PaymentErrorEvent>) {
          log_line("WARN", "log.payment_error source=" + evt.source);
        } else if constexpr (std::is_same_v<T, ImportEvent>) {
          log_line("INFO", "pool.import added=" + std::to_string(evt.added) +
                               " skipped=" + std::to_string(evt.skipped) +
                               " ignored=" + std::to_string(evt.ignored));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RemoteLatencyMetric>) {
          log_line("DEBUG", "metric.remote_latency_ms endpoint=" + m.endpoint +
                                " value=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, PoolSizeMetric>) {
          log_line("DEBUG", "metric.pool_size=" + std::to_string(m.size));
        }
      },
      metric);
}

} // namespace quotaswap::observability

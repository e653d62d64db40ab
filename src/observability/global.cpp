#include "quotaswap/observability/global.hpp"

#include <mutex>

namespace quotaswap::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_usage_checked(const std::string &credential_id, const std::string &fingerprint,
                          const double ratio, const std::string &trigger) {
  record_event(UsageCheckedEvent{.credential_id = credential_id,
                                 .fingerprint = fingerprint,
                                 .ratio = ratio,
                                 .trigger = trigger});
}

void record_tokens_refreshed(const std::string &credential_id, const std::string &fingerprint) {
  record_event(TokensRefreshedEvent{.credential_id = credential_id, .fingerprint = fingerprint});
}

void record_failover(const std::string &from_id, const std::string &to_id,
                     const std::string &outcome, const double ratio, const bool automatic) {
  record_event(FailoverEvent{.from_id = from_id,
                             .to_id = to_id,
                             .outcome = outcome,
                             .ratio = ratio,
                             .automatic = automatic});
}

void record_payment_error(const std::string &source) {
  record_event(PaymentErrorEvent{.source = source});
}

void record_import(const std::size_t added, const std::size_t skipped, const std::size_t ignored) {
  record_event(ImportEvent{.added = added, .skipped = skipped, .ignored = ignored});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_remote_latency(const std::string &endpoint, const std::chrono::milliseconds latency) {
  record_metric(RemoteLatencyMetric{.endpoint = endpoint, .latency = latency});
}

void record_pool_size(const std::size_t size) {
  record_metric(PoolSizeMetric{.size = static_cast<std::uint64_t>(size)});
}

} // namespace quotaswap::observability

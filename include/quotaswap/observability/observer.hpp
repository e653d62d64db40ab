#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace quotaswap::observability {

struct UsageCheckedEvent {
  std::string credential_id;
  std::string fingerprint;
  double ratio = -1.0;
  std::string trigger;
};

struct TokensRefreshedEvent {
  std::string credential_id;
  std::string fingerprint;
};

struct FailoverEvent {
  std::string from_id;
  std::string to_id;
  std::string outcome;
  double ratio = -1.0;
  bool automatic = false;
};

struct PaymentErrorEvent {
  std::string source;
};

struct ImportEvent {
  std::size_t added = 0;
  std::size_t skipped = 0;
  std::size_t ignored = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<UsageCheckedEvent, TokensRefreshedEvent, FailoverEvent,
                                   PaymentErrorEvent, ImportEvent, ErrorEvent>;

struct RemoteLatencyMetric {
  std::string endpoint;
  std::chrono::milliseconds latency{0};
};

struct PoolSizeMetric {
  std::uint64_t size = 0;
};

using ObserverMetric = std::variant<RemoteLatencyMetric, PoolSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace quotaswap::observability

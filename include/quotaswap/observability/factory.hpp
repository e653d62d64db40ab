#pragma once

#include "quotaswap/config/schema.hpp"
#include "quotaswap/observability/observer.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace quotaswap::observability {

/// Delivers every event to each sink in turn. Coordinator workers, the poller
/// and the log watcher report concurrently; delivery is serialized so sinks
/// see one event at a time and in a single order.
class FanoutObserver final : public IObserver {
public:
  void add_sink(std::unique_ptr<IObserver> sink);
  [[nodiscard]] std::size_t sink_count() const;

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "fanout"; }

private:
  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<IObserver>> sinks_;
};

/// Observer that drops everything; used for `observability.backend = "none"`.
[[nodiscard]] std::unique_ptr<IObserver> create_silent_observer();

/// Build the observer named by `observability.backend` ("log", "none", or a
/// comma list). Silent and repeated names in a list are skipped.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace quotaswap::observability

#include "quotaswap/observability/factory.hpp"

#include "quotaswap/common/fs.hpp"
#include "quotaswap/observability/log_observer.hpp"

#include <set>

namespace quotaswap::observability {

namespace {

class SilentObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "none"; }
};

bool is_silent(const std::string &backend) {
  return backend.empty() || backend == "none" || backend == "noop";
}

} // namespace

void FanoutObserver::add_sink(std::unique_ptr<IObserver> sink) {
  if (sink == nullptr) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_.push_back(std::move(sink));
}

std::size_t FanoutObserver::sink_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sinks_.size();
}

void FanoutObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &sink : sinks_) {
    sink->record_event(event);
  }
}

void FanoutObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &sink : sinks_) {
    sink->record_metric(metric);
  }
}

void FanoutObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &sink : sinks_) {
    sink->flush();
  }
}

std::unique_ptr<IObserver> create_silent_observer() { return std::make_unique<SilentObserver>(); }

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.find(',') == std::string::npos) {
    if (is_silent(backend)) {
      return create_silent_observer();
    }
    return std::make_unique<LogObserver>();
  }

  std::set<std::string> seen;
  auto fanout = std::make_unique<FanoutObserver>();
  for (const auto &part : common::split(backend, ",")) {
    const std::string name = common::trim(part);
    if (is_silent(name) || !seen.insert(name).second) {
      continue;
    }
    fanout->add_sink(std::make_unique<LogObserver>());
  }
  if (fanout->sink_count() == 0) {
    return create_silent_observer();
  }
  return fanout;
}

} // namespace quotaswap::observability

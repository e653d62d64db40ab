#pragma once

#include "quotaswap/observability/observer.hpp"

#include <memory>

namespace quotaswap::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_usage_checked(const std::string &credential_id, const std::string &fingerprint,
                          double ratio, const std::string &trigger);
void record_tokens_refreshed(const std::string &credential_id, const std::string &fingerprint);
void record_failover(const std::string &from_id, const std::string &to_id,
                     const std::string &outcome, double ratio, bool automatic);
void record_payment_error(const std::string &source);
void record_import(std::size_t added, std::size_t skipped, std::size_t ignored);
void record_error(const std::string &component, const std::string &message);

void record_remote_latency(const std::string &endpoint, std::chrono::milliseconds latency);
void record_pool_size(std::size_t size);

} // namespace quotaswap::observability

#pragma once

#include "couponvault/observability/observer.hpp"

#include <memory>

namespace couponvault::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_coupon_exchanged(const std::string &coupon_id, const std::string &kind,
                             std::int64_t points_spent);
void record_coupon_used(const std::string &coupon_id, const std::string &via);
void record_coupon_expired(const std::string &coupon_id);
void record_verification_failed(std::uint32_t failed_attempts, std::uint32_t remaining_attempts);
void record_lockout(std::int64_t locked_until_ms);
void record_store_loaded(const std::string &source, const std::string &reason);
void record_error(const std::string &component, const std::string &message);

} // namespace couponvault::observability

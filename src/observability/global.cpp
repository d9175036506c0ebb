#include "couponvault/observability/global.hpp"

#include <mutex>

namespace couponvault::observability {

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

void record_coupon_exchanged(const std::string &coupon_id, const std::string &kind,
                             const std::int64_t points_spent) {
  record_event(CouponExchangedEvent{
      .coupon_id = coupon_id, .kind = kind, .points_spent = points_spent});
}

void record_coupon_used(const std::string &coupon_id, const std::string &via) {
  record_event(CouponUsedEvent{.coupon_id = coupon_id, .via = via});
}

void record_coupon_expired(const std::string &coupon_id) {
  record_event(CouponExpiredEvent{.coupon_id = coupon_id});
}

void record_verification_failed(const std::uint32_t failed_attempts,
                                const std::uint32_t remaining_attempts) {
  record_event(VerificationFailedEvent{.failed_attempts = failed_attempts,
                                       .remaining_attempts = remaining_attempts});
}

void record_lockout(const std::int64_t locked_until_ms) {
  record_event(LockoutEvent{.locked_until_ms = locked_until_ms});
}

void record_store_loaded(const std::string &source, const std::string &reason) {
  record_event(StoreRecoveredEvent{.source = source, .reason = reason});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace couponvault::observability

#include "couponvault/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace couponvault::observability {

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, CouponExchangedEvent>) {
          log_line("INFO", "coupon.exchange id=" + evt.coupon_id + " kind=" + evt.kind +
                               " points=" + std::to_string(evt.points_spent));
        } else if constexpr (std::is_same_v<T, CouponUsedEvent>) {
          log_line("INFO", "coupon.use id=" + evt.coupon_id + " via=" + evt.via);
        } else if constexpr (std::is_same_v<T, CouponExpiredEvent>) {
          log_line("INFO", "coupon.expire id=" + evt.coupon_id);
        } else if constexpr (std::is_same_v<T, VerificationFailedEvent>) {
          log_line("WARN", "verify.failed attempts=" + std::to_string(evt.failed_attempts) +
                               " remaining=" + std::to_string(evt.remaining_attempts));
        } else if constexpr (std::is_same_v<T, LockoutEvent>) {
          log_line("WARN", "verify.lockout until_ms=" + std::to_string(evt.locked_until_ms));
        } else if constexpr (std::is_same_v<T, StoreRecoveredEvent>) {
          log_line(evt.source == "primary" ? "DEBUG" : "WARN",
                   "store.load source=" + evt.source + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, LiveCouponsMetric>) {
          log_line("DEBUG", "metric.live_coupons=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, OperationLatencyMetric>) {
          log_line("DEBUG", "metric.latency_ms op=" + m.operation + " value=" +
                                std::to_string(m.latency.count()));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace couponvault::observability

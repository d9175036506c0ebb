#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace couponvault::observability {

struct CouponExchangedEvent {
  std::string coupon_id;
  std::string kind;
  std::int64_t points_spent = 0;
};

struct CouponUsedEvent {
  std::string coupon_id;
  // "direct" or "code"
  std::string via;
};

struct CouponExpiredEvent {
  std::string coupon_id;
};

struct VerificationFailedEvent {
  std::uint32_t failed_attempts = 0;
  std::uint32_t remaining_attempts = 0;
};

struct LockoutEvent {
  std::int64_t locked_until_ms = 0;
};

struct StoreRecoveredEvent {
  // "primary", "backup" or "fresh"
  std::string source;
  std::string reason;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<CouponExchangedEvent, CouponUsedEvent, CouponExpiredEvent, VerificationFailedEvent,
                 LockoutEvent, StoreRecoveredEvent, ErrorEvent>;

struct LiveCouponsMetric {
  std::uint64_t count = 0;
};

struct OperationLatencyMetric {
  std::string operation;
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<LiveCouponsMetric, OperationLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace couponvault::observability

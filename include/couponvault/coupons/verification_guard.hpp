#pragma once

#include "couponvault/common/result.hpp"
#include "couponvault/coupons/model.hpp"
#include "couponvault/coupons/repository.hpp"

#include <cstdint>
#include <mutex>

namespace couponvault::coupons {

struct VerificationPolicy {
  std::uint32_t max_attempts = 3;
  TimestampMs lockout_ms = 5 * 60 * common::kMillisPerSecond;
};

struct LockoutStatus {
  bool locked = false;
  TimestampMs locked_until = 0;
  TimestampMs retry_after_ms = 0;
  std::uint32_t failed_attempts = 0;
  std::uint32_t remaining_attempts = 0;
};

struct FailureRecord {
  bool locked = false;
  TimestampMs locked_until = 0;
  std::uint32_t remaining_attempts = 0;
  // The in-memory penalty applies even when this reports an error.
  common::Status persisted = common::Status::success();
};

class VerificationGuard {
public:
  VerificationGuard(ILockoutStore &store, VerificationPolicy policy);

  [[nodiscard]] common::Status restore();

  /// Gate one verification request. An expired lockout is cleared (and persisted) first, so a
  /// request exactly at `locked_until` proceeds.
  [[nodiscard]] LockoutStatus check(TimestampMs now);

  [[nodiscard]] FailureRecord record_failure(TimestampMs now);
  [[nodiscard]] common::Status record_success();

  [[nodiscard]] LockoutStatus status(TimestampMs now) const;
  [[nodiscard]] LockoutState state() const;
  [[nodiscard]] const VerificationPolicy &policy() const { return policy_; }

private:
  [[nodiscard]] LockoutStatus status_locked(TimestampMs now) const;
  [[nodiscard]] common::Status persist_locked();

  ILockoutStore &store_;
  VerificationPolicy policy_;
  mutable std::mutex mutex_;
  LockoutState state_;
};

} // namespace couponvault::coupons

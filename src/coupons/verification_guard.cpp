#include "couponvault/coupons/verification_guard.hpp"

#include "couponvault/observability/global.hpp"

namespace couponvault::coupons {

VerificationGuard::VerificationGuard(ILockoutStore &store, VerificationPolicy policy)
    : store_(store), policy_(policy) {
  if (policy_.max_attempts == 0) {
    policy_.max_attempts = 1;
  }
}

common::Status VerificationGuard::restore() {
  auto loaded = store_.load_lockout();
  std::lock_guard<std::mutex> lock(mutex_);
  if (!loaded.ok()) {
    state_ = LockoutState{};
    observability::record_error("verification", "lockout record unreadable: " + loaded.error());
    return common::Status::error(loaded.error());
  }
  state_ = loaded.value();
  if (state_.failed_attempts >= policy_.max_attempts) {
    state_.failed_attempts = policy_.max_attempts - 1;
  }
  return common::Status::success();
}

LockoutStatus VerificationGuard::check(const TimestampMs now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.locked_until != 0 && now >= state_.locked_until) {
    state_ = LockoutState{};
    const auto status = persist_locked();
    if (!status.ok()) {
      observability::record_error("verification", "unlock not persisted: " + status.error());
    }
  }
  return status_locked(now);
}

FailureRecord VerificationGuard::record_failure(const TimestampMs now) {
  std::lock_guard<std::mutex> lock(mutex_);
  FailureRecord record;

  ++state_.failed_attempts;
  if (state_.failed_attempts >= policy_.max_attempts) {
    state_.failed_attempts = 0;
    state_.locked_until = now + policy_.lockout_ms;
    record.locked = true;
    record.locked_until = state_.locked_until;
    observability::record_lockout(state_.locked_until);
  } else {
    record.remaining_attempts = policy_.max_attempts - state_.failed_attempts;
    observability::record_verification_failed(state_.failed_attempts, record.remaining_attempts);
  }

  record.persisted = persist_locked();
  if (!record.persisted.ok()) {
    observability::record_error("verification",
                                "attempt counter not persisted: " + record.persisted.error());
  }
  return record;
}

common::Status VerificationGuard::record_success() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == LockoutState{}) {
    return common::Status::success();
  }
  state_ = LockoutState{};
  return persist_locked();
}

LockoutStatus VerificationGuard::status(const TimestampMs now) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_locked(now);
}

LockoutState VerificationGuard::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

LockoutStatus VerificationGuard::status_locked(const TimestampMs now) const {
  LockoutStatus status;
  status.failed_attempts = state_.failed_attempts;
  if (state_.locked_until != 0 && now < state_.locked_until) {
    status.locked = true;
    status.locked_until = state_.locked_until;
    status.retry_after_ms = state_.locked_until - now;
    return status;
  }
  status.remaining_attempts = state_.failed_attempts < policy_.max_attempts
                                  ? policy_.max_attempts - state_.failed_attempts
                                  : 0;
  return status;
}

common::Status VerificationGuard::persist_locked() { return store_.save_lockout(state_); }

} // namespace couponvault::coupons

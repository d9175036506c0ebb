#pragma once

#include "couponvault/common/clock.hpp"
#include "couponvault/common/result.hpp"
#include "couponvault/coupons/code_generator.hpp"
#include "couponvault/coupons/history.hpp"
#include "couponvault/coupons/model.hpp"
#include "couponvault/coupons/repository.hpp"
#include "couponvault/coupons/verification_guard.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace couponvault::coupons {

class PointsLedger {
public:
  virtual ~PointsLedger() = default;

  virtual bool spend_points(std::int64_t amount, const std::string &reason) = 0;
  virtual bool add_points(std::int64_t amount, const std::string &reason) = 0;
};

enum class CouponErrorCode {
  None,
  Busy,
  Cooldown,
  InsufficientBalance,
  CapacityExceeded,
  NotFound,
  AlreadyUsed,
  Expired,
  PersistenceFailure,
  LockedOut,
  InvalidInput,
  EntropyUnavailable,
};

[[nodiscard]] const char *to_string(CouponErrorCode code);

struct CouponOutcome {
  bool success = false;
  CouponErrorCode code = CouponErrorCode::None;
  std::string message;
  std::optional<Coupon> coupon;
  // Exchange only: points left the ledger and were not given back.
  bool charged = false;
  bool refunded = false;
  TimestampMs retry_after_ms = 0;
  std::uint32_t remaining_attempts = 0;
};

struct ManagerOptions {
  std::int64_t cost_per_coupon = 50'000;
  std::size_t max_live_coupons = 100;
  std::size_t max_stored_coupons = 200;
  std::int64_t expiry_days = 90;
  TimestampMs exchange_cooldown_ms = 5'000;
  std::size_t min_code_length = SECRET_CODE_LENGTH;
  std::size_t max_history = 200;
};

/// Non-reentrant, non-queuing. A second caller is turned away instead of waiting.
class OperationLock {
public:
  class Guard {
  public:
    explicit Guard(OperationLock &lock) : lock_(lock), owns_(lock.try_acquire()) {}
    ~Guard() {
      if (owns_) {
        lock_.release();
      }
    }
    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;

    [[nodiscard]] bool owns() const { return owns_; }

  private:
    OperationLock &lock_;
    bool owns_;
  };

  [[nodiscard]] bool try_acquire() {
    bool expected = false;
    return busy_.compare_exchange_strong(expected, true, std::memory_order_acquire);
  }
  void release() { busy_.store(false, std::memory_order_release); }
  [[nodiscard]] bool busy() const { return busy_.load(std::memory_order_acquire); }

private:
  std::atomic<bool> busy_{false};
};

[[nodiscard]] std::string format_points(std::int64_t points);

/// Owns the coupon store and the verification counter. Mutations run one at a time, compute
/// the next store from a snapshot, persist it, and only then publish it to readers.
class CouponManager {
public:
  CouponManager(CouponRepository &repository, VerificationGuard &guard, ICodeGenerator &codes,
                PointsLedger &ledger, const common::Clock &clock, ManagerOptions options);
  CouponManager(CouponRepository &repository, VerificationGuard &guard, ICodeGenerator &codes,
                PointsLedger &ledger, const common::Clock &clock, ManagerOptions options,
                RandomFill id_fill);

  /// Cold start: load, repair and restore the attempt counter. Fails only while busy.
  [[nodiscard]] common::Result<LoadReport> initialize();
  [[nodiscard]] common::Result<LoadReport> reload() { return initialize(); }

  [[nodiscard]] CouponOutcome exchange(std::int64_t point_balance,
                                       CouponKind kind = CouponKind::FreeEvent);
  [[nodiscard]] CouponOutcome use_directly(const std::string &coupon_id);
  [[nodiscard]] CouponOutcome verify_by_code(const std::string &raw_code);

  [[nodiscard]] common::Status flush();

  [[nodiscard]] std::vector<Coupon> coupons() const;
  [[nodiscard]] std::vector<Coupon> available_coupons() const;
  [[nodiscard]] std::vector<HistoryEntry> history() const;
  [[nodiscard]] std::uint64_t total_exchanged() const;
  [[nodiscard]] std::uint64_t total_used() const;
  [[nodiscard]] bool can_exchange(std::int64_t point_balance) const;
  [[nodiscard]] std::int64_t points_needed_for_coupon(std::int64_t point_balance) const;
  [[nodiscard]] LockoutStatus lockout_status() const;
  [[nodiscard]] const ManagerOptions &options() const { return options_; }

private:
  [[nodiscard]] common::Result<LoadReport> load_locked();
  // False while the primary medium cannot be read; mutations must not overwrite it then.
  [[nodiscard]] bool ensure_loaded_locked();
  [[nodiscard]] CouponStore snapshot() const;
  void publish(CouponStore next);

  CouponOutcome exchange_locked(std::int64_t point_balance, CouponKind kind, bool &charged);
  CouponOutcome use_locked(const std::string &coupon_id);
  CouponOutcome verify_locked(const std::string &raw_code);
  [[nodiscard]] common::Result<std::string> unique_code(const CouponStore &store);
  [[nodiscard]] common::Status persist(const CouponStore &next);
  CouponOutcome refund_after_failure(const std::string &reason);

  CouponRepository &repository_;
  VerificationGuard &guard_;
  ICodeGenerator &codes_;
  PointsLedger &ledger_;
  const common::Clock &clock_;
  ManagerOptions options_;
  RandomFill id_fill_;
  HistoryRecorder history_;

  OperationLock operation_lock_;
  std::optional<TimestampMs> last_exchange_start_;

  mutable std::mutex state_mutex_;
  CouponStore state_;
  bool loaded_ = false;
};

} // namespace couponvault::coupons

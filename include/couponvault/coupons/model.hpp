#pragma once

#include "couponvault/common/clock.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace couponvault::coupons {

using common::TimestampMs;

enum class CouponKind { FreeEvent, Discount, Special };

struct CouponKindInfo {
  CouponKind kind;
  const char *wire_name;
  const char *name;
  const char *description;
};

[[nodiscard]] const CouponKindInfo &kind_info(CouponKind kind);
[[nodiscard]] std::optional<CouponKind> parse_kind(const std::string &wire_name);

enum class CouponState { Available, Expired, Used };

struct Coupon {
  std::string id;
  CouponKind kind = CouponKind::FreeEvent;
  std::string name;
  std::string description;
  // Formatted for display; compare through normalize_code().
  std::string secret_code;
  TimestampMs created_at = 0;
  TimestampMs expires_at = 0;
  std::optional<TimestampMs> used_at;
  // Only set when redeemed by presenting the secret code.
  std::optional<TimestampMs> verified_at;
  bool is_used = false;

  [[nodiscard]] CouponState state_at(TimestampMs now) const;
  [[nodiscard]] bool is_available_at(TimestampMs now) const {
    return state_at(now) == CouponState::Available;
  }
};

enum class HistoryAction { Exchange, Use, Expire };

[[nodiscard]] const char *to_string(HistoryAction action);
[[nodiscard]] std::optional<HistoryAction> parse_history_action(const std::string &value);

struct HistoryEntry {
  std::string id;
  HistoryAction action = HistoryAction::Exchange;
  std::string coupon_id;
  std::string coupon_name;
  std::optional<std::int64_t> points_spent;
  TimestampMs timestamp = 0;
};

struct CouponStore {
  std::vector<Coupon> coupons;
  std::vector<HistoryEntry> history;
  std::uint64_t total_exchanged = 0;
  std::uint64_t total_used = 0;

  [[nodiscard]] std::vector<Coupon> available_at(TimestampMs now) const;
  [[nodiscard]] std::size_t available_count_at(TimestampMs now) const;
  [[nodiscard]] const Coupon *find(const std::string &coupon_id) const;
  [[nodiscard]] Coupon *find(const std::string &coupon_id);

  // Oldest settled coupons go first. Returns how many were dropped.
  std::size_t trim_coupons(std::size_t max_coupons);
};

struct LockoutState {
  std::uint32_t failed_attempts = 0;
  // 0 when not locked.
  TimestampMs locked_until = 0;

  bool operator==(const LockoutState &) const = default;
};

} // namespace couponvault::coupons

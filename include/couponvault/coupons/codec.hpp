#pragma once

#include "couponvault/common/result.hpp"
#include "couponvault/coupons/model.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace couponvault::coupons {

struct DecodeLimits {
  // Arrays longer than these reject the whole record.
  std::size_t max_coupons = 1000;
  std::size_t max_history = 1000;
};

struct DecodedStore {
  CouponStore store;
  // Malformed entries skipped while decoding.
  std::size_t dropped_coupons = 0;
  std::size_t dropped_history = 0;
  // Entries that needed fields from the kind table.
  std::size_t migrated_coupons = 0;
};

// {"coupons":[...],"history":[...],"totalExchanged":n,"totalUsed":n}
[[nodiscard]] std::string encode_store(const CouponStore &store);
[[nodiscard]] common::Result<DecodedStore> decode_store(const std::string &json,
                                                        const DecodeLimits &limits);

[[nodiscard]] std::string encode_coupon(const Coupon &coupon);
[[nodiscard]] std::string encode_history_entry(const HistoryEntry &entry);

enum class BackupKind { Coupons, Metadata };

struct BackupRecord {
  BackupKind kind = BackupKind::Coupons;
  std::vector<Coupon> coupons;
  std::uint64_t total_exchanged = 0;
  std::uint64_t total_used = 0;
  std::uint64_t coupon_count = 0;
  std::uint64_t available_count = 0;
  TimestampMs saved_at = 0;
};

[[nodiscard]] std::string encode_backup(const BackupRecord &record);
[[nodiscard]] common::Result<BackupRecord> decode_backup(const std::string &json);

// {"attempts":n,"lockoutUntil":ms}
[[nodiscard]] std::string encode_lockout(const LockoutState &state);
[[nodiscard]] common::Result<LockoutState> decode_lockout(const std::string &json);

} // namespace couponvault::coupons

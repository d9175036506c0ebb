#pragma once

#include "couponvault/common/result.hpp"
#include "couponvault/coupons/code_generator.hpp"
#include "couponvault/coupons/model.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace couponvault::coupons {

class HistoryRecorder {
public:
  HistoryRecorder(std::size_t max_entries, RandomFill fill);

  [[nodiscard]] common::Result<HistoryEntry> make_entry(HistoryAction action, const Coupon &coupon,
                                                        std::optional<std::int64_t> points_spent,
                                                        TimestampMs now) const;

  // Dated at the expiry instant and keyed by coupon id, so the same repair yields the same entry.
  [[nodiscard]] static HistoryEntry make_expire_entry(const Coupon &coupon);

  void record(std::vector<HistoryEntry> &history, HistoryEntry entry) const;

  void record_front(std::vector<HistoryEntry> &history, std::vector<HistoryEntry> entries) const;

  [[nodiscard]] std::size_t max_entries() const { return max_entries_; }

private:
  void trim(std::vector<HistoryEntry> &history) const;

  std::size_t max_entries_;
  RandomFill fill_;
};

} // namespace couponvault::coupons

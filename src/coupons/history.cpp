#include "couponvault/coupons/history.hpp"

#include <iterator>

namespace couponvault::coupons {

namespace {

constexpr std::size_t HISTORY_ID_RANDOM_CHARS = 4;

} // namespace

HistoryRecorder::HistoryRecorder(const std::size_t max_entries, RandomFill fill)
    : max_entries_(max_entries), fill_(std::move(fill)) {}

common::Result<HistoryEntry> HistoryRecorder::make_entry(const HistoryAction action,
                                                         const Coupon &coupon,
                                                         const std::optional<std::int64_t> points_spent,
                                                         const TimestampMs now) const {
  auto id = make_identifier("history", now, HISTORY_ID_RANDOM_CHARS, fill_);
  if (!id.ok()) {
    return common::Result<HistoryEntry>::failure(id.error());
  }

  HistoryEntry entry;
  entry.id = std::move(id.value());
  entry.action = action;
  entry.coupon_id = coupon.id;
  entry.coupon_name = coupon.name;
  entry.points_spent = points_spent;
  entry.timestamp = now;
  return common::Result<HistoryEntry>::success(std::move(entry));
}

HistoryEntry HistoryRecorder::make_expire_entry(const Coupon &coupon) {
  HistoryEntry entry;
  entry.id = "history_expire_" + coupon.id;
  entry.action = HistoryAction::Expire;
  entry.coupon_id = coupon.id;
  entry.coupon_name = coupon.name;
  entry.timestamp = coupon.expires_at;
  return entry;
}

void HistoryRecorder::record(std::vector<HistoryEntry> &history, HistoryEntry entry) const {
  history.insert(history.begin(), std::move(entry));
  trim(history);
}

void HistoryRecorder::record_front(std::vector<HistoryEntry> &history,
                                   std::vector<HistoryEntry> entries) const {
  if (entries.empty()) {
    trim(history);
    return;
  }
  entries.insert(entries.end(), std::make_move_iterator(history.begin()),
                 std::make_move_iterator(history.end()));
  history = std::move(entries);
  trim(history);
}

void HistoryRecorder::trim(std::vector<HistoryEntry> &history) const {
  if (history.size() > max_entries_) {
    history.resize(max_entries_);
  }
}

} // namespace couponvault::coupons

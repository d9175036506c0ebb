#include "couponvault/coupons/model.hpp"

#include <algorithm>
#include <array>
#include <iterator>

namespace couponvault::coupons {

namespace {

constexpr std::array<CouponKindInfo, 3> KIND_TABLE = {{
    {CouponKind::FreeEvent, "free_event", "Free Event Pass",
     "Join any Solo Party event of your choice for free."},
    {CouponKind::Discount, "discount", "50% Discount Coupon",
     "Take 50% off the entry fee of an event."},
    {CouponKind::Special, "special", "Special Coupon", "A premium coupon with a special benefit."},
}};

} // namespace

const CouponKindInfo &kind_info(const CouponKind kind) {
  for (const auto &info : KIND_TABLE) {
    if (info.kind == kind) {
      return info;
    }
  }
  return KIND_TABLE.front();
}

std::optional<CouponKind> parse_kind(const std::string &wire_name) {
  for (const auto &info : KIND_TABLE) {
    if (wire_name == info.wire_name) {
      return info.kind;
    }
  }
  return std::nullopt;
}

CouponState Coupon::state_at(const TimestampMs now) const {
  if (is_used) {
    return CouponState::Used;
  }
  if (now >= expires_at) {
    return CouponState::Expired;
  }
  return CouponState::Available;
}

const char *to_string(const HistoryAction action) {
  switch (action) {
  case HistoryAction::Exchange:
    return "exchange";
  case HistoryAction::Use:
    return "use";
  case HistoryAction::Expire:
    return "expire";
  }
  return "exchange";
}

std::optional<HistoryAction> parse_history_action(const std::string &value) {
  if (value == "exchange") {
    return HistoryAction::Exchange;
  }
  if (value == "use") {
    return HistoryAction::Use;
  }
  if (value == "expire") {
    return HistoryAction::Expire;
  }
  return std::nullopt;
}

std::vector<Coupon> CouponStore::available_at(const TimestampMs now) const {
  std::vector<Coupon> out;
  std::copy_if(coupons.begin(), coupons.end(), std::back_inserter(out),
               [now](const Coupon &coupon) { return coupon.is_available_at(now); });
  return out;
}

std::size_t CouponStore::available_count_at(const TimestampMs now) const {
  return static_cast<std::size_t>(
      std::count_if(coupons.begin(), coupons.end(),
                    [now](const Coupon &coupon) { return coupon.is_available_at(now); }));
}

const Coupon *CouponStore::find(const std::string &coupon_id) const {
  const auto it = std::find_if(coupons.begin(), coupons.end(),
                               [&coupon_id](const Coupon &c) { return c.id == coupon_id; });
  return it == coupons.end() ? nullptr : &*it;
}

Coupon *CouponStore::find(const std::string &coupon_id) {
  const auto it = std::find_if(coupons.begin(), coupons.end(),
                               [&coupon_id](const Coupon &c) { return c.id == coupon_id; });
  return it == coupons.end() ? nullptr : &*it;
}

std::size_t CouponStore::trim_coupons(const std::size_t max_coupons) {
  std::size_t dropped = 0;
  while (coupons.size() > max_coupons) {
    const auto settled = std::find_if(coupons.rbegin(), coupons.rend(),
                                      [](const Coupon &c) { return c.is_used; });
    if (settled != coupons.rend()) {
      coupons.erase(std::next(settled).base());
    } else {
      coupons.pop_back();
    }
    ++dropped;
  }
  return dropped;
}

} // namespace couponvault::coupons

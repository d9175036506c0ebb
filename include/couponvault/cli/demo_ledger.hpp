#pragma once

#include "couponvault/common/result.hpp"
#include "couponvault/coupons/manager.hpp"
#include "couponvault/storage/key_value_store.hpp"

#include <cstdint>
#include <memory>

namespace couponvault::cli {

inline constexpr const char *POINTS_BALANCE_KEY = "points.balance";

class DemoLedger final : public coupons::PointsLedger {
public:
  explicit DemoLedger(storage::IKeyValueStore &store);

  [[nodiscard]] common::Result<std::int64_t> balance();
  [[nodiscard]] common::Status set_balance(std::int64_t balance);

  bool spend_points(std::int64_t amount, const std::string &reason) override;
  bool add_points(std::int64_t amount, const std::string &reason) override;

private:
  storage::IKeyValueStore &store_;
};

[[nodiscard]] std::unique_ptr<coupons::PointsLedger>
make_demo_ledger(storage::IKeyValueStore &store);

} // namespace couponvault::cli

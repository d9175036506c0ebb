#include "couponvault/cli/demo_ledger.hpp"

#include "couponvault/observability/global.hpp"

#include <charconv>

namespace couponvault::cli {

DemoLedger::DemoLedger(storage::IKeyValueStore &store) : store_(store) {}

std::unique_ptr<coupons::PointsLedger> make_demo_ledger(storage::IKeyValueStore &store) {
  return std::make_unique<DemoLedger>(store);
}

common::Result<std::int64_t> DemoLedger::balance() {
  auto raw = store_.get(POINTS_BALANCE_KEY);
  if (!raw.ok()) {
    return common::Result<std::int64_t>::failure(raw.error());
  }
  if (!raw.value().has_value()) {
    return common::Result<std::int64_t>::success(0);
  }
  const auto &text = *raw.value();
  std::int64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size() || value < 0) {
    return common::Result<std::int64_t>::failure("stored balance is not a non-negative integer");
  }
  return common::Result<std::int64_t>::success(value);
}

common::Status DemoLedger::set_balance(const std::int64_t balance) {
  if (balance < 0) {
    return common::Status::error("balance cannot be negative");
  }
  return store_.put(POINTS_BALANCE_KEY, std::to_string(balance));
}

bool DemoLedger::spend_points(const std::int64_t amount, const std::string &reason) {
  auto current = balance();
  if (!current.ok() || amount <= 0 || current.value() < amount) {
    return false;
  }
  const auto status = set_balance(current.value() - amount);
  if (!status.ok()) {
    observability::record_error("ledger", reason + ": " + status.error());
    return false;
  }
  return true;
}

bool DemoLedger::add_points(const std::int64_t amount, const std::string &reason) {
  auto current = balance();
  if (!current.ok() || amount <= 0) {
    return false;
  }
  const auto status = set_balance(current.value() + amount);
  if (!status.ok()) {
    observability::record_error("ledger", reason + ": " + status.error());
    return false;
  }
  return true;
}

} // namespace couponvault::cli

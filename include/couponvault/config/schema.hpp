#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace couponvault::config {

struct CouponsConfig {
  std::int64_t cost_per_coupon = 50'000;
  std::uint32_t max_live_coupons = 100;
  // Live plus used coupons kept on disk.
  std::uint32_t max_stored_coupons = 200;
  std::uint32_t max_history = 200;
  std::uint32_t expiry_days = 90;
  std::int64_t exchange_cooldown_ms = 5'000;
};

struct VerificationConfig {
  std::uint32_t max_attempts = 3;
  std::int64_t lockout_seconds = 300;
  std::uint32_t min_code_length = 12;
};

struct StorageConfig {
  // Empty means the config directory.
  std::string data_dir;
  std::string database_file = "coupons.db";
  std::string backup_dir = "backup";
  std::size_t backup_max_bytes = 2048;
  std::uint32_t backup_max_coupons = 5;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  CouponsConfig coupons;
  VerificationConfig verification;
  StorageConfig storage;
  ObservabilityConfig observability;
};

} // namespace couponvault::config

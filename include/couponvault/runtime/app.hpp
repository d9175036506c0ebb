#pragma once

#include "couponvault/common/clock.hpp"
#include "couponvault/common/result.hpp"
#include "couponvault/config/schema.hpp"
#include "couponvault/coupons/manager.hpp"
#include "couponvault/coupons/repository.hpp"
#include "couponvault/coupons/verification_guard.hpp"
#include "couponvault/storage/file_kv_store.hpp"
#include "couponvault/storage/sqlite_kv_store.hpp"

#include <filesystem>
#include <functional>
#include <memory>

namespace couponvault::runtime {

[[nodiscard]] coupons::ManagerOptions manager_options(const config::Config &config);
[[nodiscard]] coupons::RepositoryOptions repository_options(const config::Config &config);
[[nodiscard]] coupons::VerificationPolicy verification_policy(const config::Config &config);

// Builds the host's points ledger; it may keep its balance in the primary medium.
using LedgerFactory =
    std::function<std::unique_ptr<coupons::PointsLedger>(storage::IKeyValueStore &primary)>;

class CouponService {
public:
  CouponService(std::unique_ptr<storage::SqliteKeyValueStore> primary,
                std::unique_ptr<storage::FileKeyValueStore> backup, security::SecretKey key,
                const config::Config &config, const LedgerFactory &make_ledger,
                const common::Clock &clock);

  CouponService(const CouponService &) = delete;
  CouponService &operator=(const CouponService &) = delete;

  [[nodiscard]] coupons::CouponManager &manager() { return *manager_; }
  [[nodiscard]] storage::SqliteKeyValueStore &primary_store() { return *primary_; }
  [[nodiscard]] coupons::CouponRepository &repository() { return *repository_; }
  [[nodiscard]] coupons::PointsLedger &ledger() { return *ledger_; }

private:
  std::unique_ptr<storage::SqliteKeyValueStore> primary_;
  std::unique_ptr<storage::FileKeyValueStore> backup_;
  std::unique_ptr<coupons::SecretCodeGenerator> codes_;
  std::unique_ptr<coupons::PointsLedger> ledger_;
  std::unique_ptr<coupons::CouponRepository> repository_;
  std::unique_ptr<coupons::VerificationGuard> guard_;
  std::unique_ptr<coupons::CouponManager> manager_;
};

class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  [[nodiscard]] common::Result<std::shared_ptr<CouponService>>
  create_coupon_service(const LedgerFactory &make_ledger,
                        const common::Clock &clock = common::system_clock());

private:
  config::Config config_;
};

} // namespace couponvault::runtime

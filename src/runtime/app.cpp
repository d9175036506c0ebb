#include "couponvault/runtime/app.hpp"

#include "couponvault/config/config.hpp"
#include "couponvault/observability/factory.hpp"
#include "couponvault/observability/global.hpp"
#include "couponvault/security/secrets.hpp"

namespace couponvault::runtime {

namespace {

constexpr const char *DEVICE_KEY_FILE = "device.key";

} // namespace

coupons::ManagerOptions manager_options(const config::Config &config) {
  return coupons::ManagerOptions{
      .cost_per_coupon = config.coupons.cost_per_coupon,
      .max_live_coupons = config.coupons.max_live_coupons,
      .max_stored_coupons = config.coupons.max_stored_coupons,
      .expiry_days = config.coupons.expiry_days,
      .exchange_cooldown_ms = config.coupons.exchange_cooldown_ms,
      .min_code_length = config.verification.min_code_length,
      .max_history = config.coupons.max_history,
  };
}

coupons::RepositoryOptions repository_options(const config::Config &config) {
  coupons::RepositoryOptions options;
  options.max_coupons = config.coupons.max_stored_coupons;
  options.max_history = config.coupons.max_history;
  options.backup_max_bytes = config.storage.backup_max_bytes;
  options.backup_max_coupons = config.storage.backup_max_coupons;
  return options;
}

coupons::VerificationPolicy verification_policy(const config::Config &config) {
  return coupons::VerificationPolicy{
      .max_attempts = config.verification.max_attempts,
      .lockout_ms = config.verification.lockout_seconds * common::kMillisPerSecond,
  };
}

CouponService::CouponService(std::unique_ptr<storage::SqliteKeyValueStore> primary,
                             std::unique_ptr<storage::FileKeyValueStore> backup,
                             security::SecretKey key, const config::Config &config,
                             const LedgerFactory &make_ledger, const common::Clock &clock)
    : primary_(std::move(primary)), backup_(std::move(backup)),
      codes_(std::make_unique<coupons::SecretCodeGenerator>()), ledger_(make_ledger(*primary_)) {
  repository_ = std::make_unique<coupons::CouponRepository>(
      *primary_, *backup_, key, repository_options(config), *codes_, clock);
  guard_ = std::make_unique<coupons::VerificationGuard>(*repository_, verification_policy(config));
  manager_ = std::make_unique<coupons::CouponManager>(*repository_, *guard_, *codes_, *ledger_,
                                                      clock, manager_options(config));
}

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.error());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

common::Result<std::shared_ptr<CouponService>>
RuntimeContext::create_coupon_service(const LedgerFactory &make_ledger,
                                      const common::Clock &clock) {
  observability::set_global_observer(observability::create_observer(config_));

  auto validated = config::validate_config(config_);
  if (!validated.ok()) {
    return common::Result<std::shared_ptr<CouponService>>::failure(validated.error());
  }
  for (const auto &warning : validated.value()) {
    observability::record_error("config", warning);
  }

  auto dir = config::data_dir(config_);
  if (!dir.ok()) {
    return common::Result<std::shared_ptr<CouponService>>::failure(dir.error());
  }

  auto key = security::load_or_create_key(dir.value() / DEVICE_KEY_FILE);
  if (!key.ok()) {
    return common::Result<std::shared_ptr<CouponService>>::failure(key.error());
  }

  auto primary =
      std::make_unique<storage::SqliteKeyValueStore>(dir.value() / config_.storage.database_file);
  if (!primary->is_open()) {
    return common::Result<std::shared_ptr<CouponService>>::failure(
        "failed to open coupon database at " + primary->path().string());
  }
  auto backup = std::make_unique<storage::FileKeyValueStore>(
      dir.value() / config_.storage.backup_dir, config_.storage.backup_max_bytes);

  auto service = std::make_shared<CouponService>(std::move(primary), std::move(backup),
                                                 key.value(), config_, make_ledger, clock);
  auto report = service->manager().initialize();
  if (!report.ok()) {
    return common::Result<std::shared_ptr<CouponService>>::failure(report.error());
  }
  return common::Result<std::shared_ptr<CouponService>>::success(std::move(service));
}

} // namespace couponvault::runtime

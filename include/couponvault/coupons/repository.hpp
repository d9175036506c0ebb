#pragma once

#include "couponvault/common/clock.hpp"
#include "couponvault/common/result.hpp"
#include "couponvault/coupons/code_generator.hpp"
#include "couponvault/coupons/codec.hpp"
#include "couponvault/coupons/history.hpp"
#include "couponvault/coupons/model.hpp"
#include "couponvault/security/secrets.hpp"
#include "couponvault/storage/key_value_store.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace couponvault::coupons {

inline constexpr const char *PRIMARY_STORE_KEY = "coupons.data";
inline constexpr const char *BACKUP_STORE_KEY = "coupons.backup";
inline constexpr const char *LOCKOUT_STORE_KEY = "coupons.verify_lockout";

struct RepositoryOptions {
  std::size_t max_coupons = 200;
  std::size_t max_history = 200;
  // A record whose lists exceed cap * factor is treated as corrupt and discarded whole.
  std::size_t corruption_factor = 5;
  std::size_t backup_max_bytes = 2048;
  std::size_t backup_max_coupons = 5;
};

enum class LoadSource { Primary, Backup, Fresh };

[[nodiscard]] const char *to_string(LoadSource source);

struct LoadReport {
  CouponStore store;
  LoadSource source = LoadSource::Fresh;
  // Why the primary record was not used; empty when it was.
  std::string fallback_reason;
  // The primary medium failed to answer, so its record may still be intact. The store is
  // served read-only and nothing is written back.
  bool primary_unreadable = false;
  std::size_t backfilled_codes = 0;
  std::size_t expired_coupons = 0;
  std::size_t dropped_entries = 0;
  // Coupons whose name or description came from the kind table.
  std::size_t migrated_coupons = 0;
  // Repairs were persisted so the next load starts from the repaired state.
  bool written_back = false;
};

/// Persistence for the failed-attempt counter; kept apart from the coupon record so leaving the
/// verification screen cannot reset it.
class ILockoutStore {
public:
  virtual ~ILockoutStore() = default;

  /// A missing record is a fresh state; an unreadable one is an error.
  [[nodiscard]] virtual common::Result<LockoutState> load_lockout() = 0;
  [[nodiscard]] virtual common::Status save_lockout(const LockoutState &state) = 0;
};

class CouponRepository final : public ILockoutStore {
public:
  CouponRepository(storage::IKeyValueStore &primary, storage::IKeyValueStore &backup,
                   security::SecretKey key, RepositoryOptions options, ICodeGenerator &codes,
                   const common::Clock &clock);

  /// Never fails: falls back from primary to backup to an empty store, then repairs.
  [[nodiscard]] LoadReport load();

  /// Writes the primary record and reads it back. On a failed read-back the previous record is
  /// put back before the error is returned; the backup is refreshed only after a verified write.
  [[nodiscard]] common::Status save(const CouponStore &store);

  [[nodiscard]] common::Result<LockoutState> load_lockout() override;
  [[nodiscard]] common::Status save_lockout(const LockoutState &state) override;

  [[nodiscard]] const RepositoryOptions &options() const { return options_; }

private:
  [[nodiscard]] common::Result<DecodedStore> read_primary(bool &unreadable);
  [[nodiscard]] common::Status restore_primary(const std::optional<std::string> &previous);
  [[nodiscard]] common::Result<CouponStore> read_backup();
  [[nodiscard]] common::Status write_backup(const CouponStore &store);
  void repair(LoadReport &report);

  storage::IKeyValueStore &primary_;
  storage::IKeyValueStore &backup_;
  security::SecretKey key_;
  RepositoryOptions options_;
  ICodeGenerator &codes_;
  const common::Clock &clock_;
  HistoryRecorder history_;
};

} // namespace couponvault::coupons

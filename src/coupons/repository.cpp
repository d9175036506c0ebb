#include "couponvault/coupons/repository.hpp"

#include "couponvault/observability/global.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace couponvault::coupons {

namespace {

constexpr std::size_t CODE_BACKFILL_ATTEMPTS = 8;

std::unordered_set<std::string> collect_codes(const CouponStore &store) {
  std::unordered_set<std::string> codes;
  for (const auto &coupon : store.coupons) {
    if (!coupon.secret_code.empty()) {
      codes.insert(normalize_code(coupon.secret_code));
    }
  }
  return codes;
}

CouponStore store_from_backup(const BackupRecord &record) {
  CouponStore store;
  store.total_exchanged = record.total_exchanged;
  store.total_used = record.total_used;
  if (record.kind == BackupKind::Coupons) {
    store.coupons = record.coupons;
  }
  return store;
}

} // namespace

const char *to_string(const LoadSource source) {
  switch (source) {
  case LoadSource::Primary:
    return "primary";
  case LoadSource::Backup:
    return "backup";
  case LoadSource::Fresh:
    return "fresh";
  }
  return "fresh";
}

CouponRepository::CouponRepository(storage::IKeyValueStore &primary,
                                   storage::IKeyValueStore &backup, security::SecretKey key,
                                   RepositoryOptions options, ICodeGenerator &codes,
                                   const common::Clock &clock)
    : primary_(primary), backup_(backup), key_(key), options_(options), codes_(codes),
      clock_(clock), history_(options.max_history, security::secure_random_bytes) {}

LoadReport CouponRepository::load() {
  LoadReport report;

  bool unreadable = false;
  auto primary = read_primary(unreadable);
  report.primary_unreadable = unreadable;
  if (primary.ok()) {
    report.store = std::move(primary.value().store);
    report.source = LoadSource::Primary;
    report.dropped_entries = primary.value().dropped_coupons + primary.value().dropped_history;
    report.migrated_coupons = primary.value().migrated_coupons;
  } else {
    report.fallback_reason = primary.error();
    auto backup = read_backup();
    if (backup.ok()) {
      report.store = std::move(backup.value());
      report.source = LoadSource::Backup;
    } else {
      report.fallback_reason += "; backup: " + backup.error();
      report.source = LoadSource::Fresh;
    }
  }
  observability::record_store_loaded(to_string(report.source), report.fallback_reason);

  repair(report);

  if (report.primary_unreadable) {
    observability::record_error("repository", std::string("primary unreadable, serving ") +
                                                  to_string(report.source) +
                                                  " read-only: " + report.fallback_reason);
    return report;
  }

  const bool repaired = report.backfilled_codes > 0 || report.expired_coupons > 0 ||
                        report.dropped_entries > 0 || report.migrated_coupons > 0;
  if (repaired || report.source == LoadSource::Backup) {
    const auto status = save(report.store);
    if (status.ok()) {
      report.written_back = true;
    } else {
      observability::record_error("repository", "write-back after load failed: " + status.error());
    }
  }
  return report;
}

common::Result<DecodedStore> CouponRepository::read_primary(bool &unreadable) {
  auto raw = primary_.get(PRIMARY_STORE_KEY);
  if (!raw.ok()) {
    unreadable = true;
    return common::Result<DecodedStore>::failure("primary read failed: " + raw.error());
  }
  if (!raw.value().has_value()) {
    return common::Result<DecodedStore>::failure("primary record absent");
  }
  auto plain = security::decrypt_secret(key_, *raw.value());
  if (!plain.ok()) {
    return common::Result<DecodedStore>::failure("primary record rejected: " + plain.error());
  }
  const DecodeLimits limits{
      .max_coupons = options_.max_coupons * options_.corruption_factor,
      .max_history = options_.max_history * options_.corruption_factor,
  };
  auto decoded = decode_store(plain.value(), limits);
  if (!decoded.ok()) {
    return common::Result<DecodedStore>::failure("primary record invalid: " + decoded.error());
  }
  return decoded;
}

common::Result<CouponStore> CouponRepository::read_backup() {
  auto raw = backup_.get(BACKUP_STORE_KEY);
  if (!raw.ok()) {
    return common::Result<CouponStore>::failure(raw.error());
  }
  if (!raw.value().has_value()) {
    return common::Result<CouponStore>::failure("absent");
  }
  auto plain = security::decrypt_secret(key_, *raw.value());
  if (!plain.ok()) {
    return common::Result<CouponStore>::failure(plain.error());
  }
  auto record = decode_backup(plain.value());
  if (!record.ok()) {
    return common::Result<CouponStore>::failure(record.error());
  }
  return common::Result<CouponStore>::success(store_from_backup(record.value()));
}

void CouponRepository::repair(LoadReport &report) {
  CouponStore &store = report.store;
  const auto now = clock_.now_ms();

  report.dropped_entries += store.trim_coupons(options_.max_coupons);

  auto known = collect_codes(store);
  for (auto &coupon : store.coupons) {
    if (!coupon.secret_code.empty() && is_well_formed_code(normalize_code(coupon.secret_code))) {
      continue;
    }
    for (std::size_t attempt = 0; attempt < CODE_BACKFILL_ATTEMPTS; ++attempt) {
      auto code = codes_.generate();
      if (!code.ok()) {
        observability::record_error("repository", "code backfill for " + coupon.id +
                                                      " failed: " + code.error());
        break;
      }
      if (known.insert(normalize_code(code.value())).second) {
        coupon.secret_code = std::move(code.value());
        ++report.backfilled_codes;
        break;
      }
    }
  }

  std::vector<HistoryEntry> expired;
  for (auto &coupon : store.coupons) {
    if (coupon.is_used || now < coupon.expires_at) {
      continue;
    }
    coupon.is_used = true;
    coupon.used_at = coupon.expires_at;
    expired.push_back(HistoryRecorder::make_expire_entry(coupon));
    observability::record_coupon_expired(coupon.id);
  }
  report.expired_coupons = expired.size();
  if (!expired.empty()) {
    std::sort(expired.begin(), expired.end(), [](const HistoryEntry &a, const HistoryEntry &b) {
      return a.timestamp > b.timestamp;
    });
  }
  history_.record_front(store.history, std::move(expired));
}

common::Status CouponRepository::save(const CouponStore &store) {
  auto sealed = security::encrypt_secret(key_, encode_store(store));
  if (!sealed.ok()) {
    return common::Status::error("encrypt failed: " + sealed.error());
  }
  auto previous = primary_.get(PRIMARY_STORE_KEY);
  if (!previous.ok()) {
    return common::Status::error("primary read before write failed: " + previous.error());
  }
  const auto put = primary_.put(PRIMARY_STORE_KEY, sealed.value());
  if (!put.ok()) {
    return common::Status::error("primary write failed: " + put.error());
  }

  auto readback = primary_.get(PRIMARY_STORE_KEY);
  std::string failed;
  if (!readback.ok()) {
    failed = "primary read-back failed: " + readback.error();
  } else if (!readback.value().has_value() || *readback.value() != sealed.value()) {
    failed = "primary read-back mismatch";
  }
  if (!failed.empty()) {
    const auto restored = restore_primary(previous.value());
    if (!restored.ok()) {
      observability::record_error("repository", "restoring previous record failed: " +
                                                    restored.error());
      return common::Status::error(failed + "; previous record not restored: " + restored.error());
    }
    return common::Status::error(failed);
  }

  const auto backup = write_backup(store);
  if (!backup.ok()) {
    observability::record_error("repository", "backup write failed: " + backup.error());
  }
  return common::Status::success();
}

common::Status CouponRepository::restore_primary(const std::optional<std::string> &previous) {
  if (!previous.has_value()) {
    return primary_.remove(PRIMARY_STORE_KEY);
  }
  return primary_.put(PRIMARY_STORE_KEY, *previous);
}

common::Status CouponRepository::write_backup(const CouponStore &store) {
  const auto now = clock_.now_ms();

  BackupRecord record;
  record.kind = BackupKind::Coupons;
  record.total_exchanged = store.total_exchanged;
  record.total_used = store.total_used;
  record.saved_at = now;
  for (const auto &coupon : store.coupons) {
    if (record.coupons.size() >= options_.backup_max_coupons) {
      break;
    }
    if (!coupon.is_used) {
      record.coupons.push_back(coupon);
    }
  }

  auto sealed = security::encrypt_secret(key_, encode_backup(record));
  if (!sealed.ok()) {
    return common::Status::error(sealed.error());
  }
  if (sealed.value().size() > options_.backup_max_bytes) {
    BackupRecord meta;
    meta.kind = BackupKind::Metadata;
    meta.total_exchanged = store.total_exchanged;
    meta.total_used = store.total_used;
    meta.coupon_count = store.coupons.size();
    meta.available_count = store.available_count_at(now);
    meta.saved_at = now;
    sealed = security::encrypt_secret(key_, encode_backup(meta));
    if (!sealed.ok()) {
      return common::Status::error(sealed.error());
    }
    if (sealed.value().size() > options_.backup_max_bytes) {
      return common::Status::error("metadata backup exceeds " +
                                   std::to_string(options_.backup_max_bytes) + " bytes");
    }
  }
  return backup_.put(BACKUP_STORE_KEY, sealed.value());
}

common::Result<LockoutState> CouponRepository::load_lockout() {
  auto raw = primary_.get(LOCKOUT_STORE_KEY);
  if (!raw.ok()) {
    return common::Result<LockoutState>::failure(raw.error());
  }
  if (!raw.value().has_value()) {
    return common::Result<LockoutState>::success(LockoutState{});
  }
  auto plain = security::decrypt_secret(key_, *raw.value());
  if (!plain.ok()) {
    return common::Result<LockoutState>::failure("lockout record rejected: " + plain.error());
  }
  return decode_lockout(plain.value());
}

common::Status CouponRepository::save_lockout(const LockoutState &state) {
  auto sealed = security::encrypt_secret(key_, encode_lockout(state));
  if (!sealed.ok()) {
    return common::Status::error(sealed.error());
  }
  return primary_.put(LOCKOUT_STORE_KEY, sealed.value());
}

} // namespace couponvault::coupons

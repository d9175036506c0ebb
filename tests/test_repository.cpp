#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "couponvault/coupons/codec.hpp"
#include "couponvault/coupons/repository.hpp"
#include "couponvault/security/secrets.hpp"

namespace {

namespace cp = couponvault::coupons;
namespace sec = couponvault::security;
namespace t = couponvault::testing;

using couponvault::common::kMillisPerDay;

struct RepoFixture {
  t::FlakyKeyValueStore primary;
  t::FlakyKeyValueStore backup;
  t::ManualClock clock;
  cp::SecretCodeGenerator codes;
  cp::RepositoryOptions options;
  std::unique_ptr<cp::CouponRepository> repo;

  explicit RepoFixture(cp::RepositoryOptions opts = {}) : options(opts) { reopen(); }

  void reopen() {
    repo = std::make_unique<cp::CouponRepository>(primary, backup, t::test_key(), options, codes,
                                                  clock);
  }

  void seal_primary(const std::string &plaintext) {
    const auto sealed = sec::encrypt_secret(t::test_key(), plaintext);
    couponvault::tests::require(sealed.ok(), sealed.error());
    primary.set_raw(cp::PRIMARY_STORE_KEY, sealed.value());
  }
};

cp::CouponStore two_coupon_store(const couponvault::common::TimestampMs now) {
  cp::CouponStore store;
  store.coupons.push_back(
      t::make_coupon("coupon_b", "BBBB-CCCC-DDDD", now - 1000, now + 90 * kMillisPerDay));
  store.coupons.push_back(
      t::make_coupon("coupon_a", "AAAA-BBBB-CCCC", now - 2000, now + 90 * kMillisPerDay));
  store.total_exchanged = 2;
  return store;
}

} // namespace

void register_repository_tests(std::vector<couponvault::tests::TestCase> &tests) {
  using couponvault::tests::require;

  tests.push_back({"repository_save_then_load_from_primary", [] {
                     RepoFixture fx;
                     const auto store = two_coupon_store(fx.clock.now_ms());
                     require(fx.repo->save(store).ok(), "save failed");

                     fx.reopen();
                     const auto report = fx.repo->load();
                     require(report.source == cp::LoadSource::Primary, "should load primary");
                     require(report.fallback_reason.empty(), "no fallback expected");
                     require(!report.written_back, "clean load should not write");
                     require(report.store.coupons.size() == 2, "two coupons expected");
                     require(report.store.coupons[0].secret_code == "BBBB-CCCC-DDDD", "code");
                     require(report.store.total_exchanged == 2, "totals should survive");
                   }});

  tests.push_back({"repository_records_are_encrypted_at_rest", [] {
                     RepoFixture fx;
                     require(fx.repo->save(two_coupon_store(fx.clock.now_ms())).ok(), "save");
                     const auto primary = fx.primary.raw(cp::PRIMARY_STORE_KEY);
                     const auto backup = fx.backup.raw(cp::BACKUP_STORE_KEY);
                     require(primary.has_value() && backup.has_value(), "both records written");
                     require(sec::is_encrypted_blob(*primary), "primary must be sealed");
                     require(sec::is_encrypted_blob(*backup), "backup must be sealed");
                     require(primary->find("BBBB") == std::string::npos, "code leaked");
                     require(backup->find("BBBB") == std::string::npos, "code leaked in backup");
                   }});

  tests.push_back({"repository_tampered_primary_recovers_from_backup", [] {
                     RepoFixture fx;
                     auto store = two_coupon_store(fx.clock.now_ms());
                     store.coupons[1].is_used = true;
                     store.coupons[1].used_at = fx.clock.now_ms();
                     store.total_used = 1;
                     require(fx.repo->save(store).ok(), "save");

                     auto blob = *fx.primary.raw(cp::PRIMARY_STORE_KEY);
                     blob[blob.size() / 2] = blob[blob.size() / 2] == 'x' ? 'y' : 'x';
                     fx.primary.set_raw(cp::PRIMARY_STORE_KEY, blob);

                     fx.reopen();
                     const auto report = fx.repo->load();
                     require(report.source == cp::LoadSource::Backup, "backup expected");
                     require(!report.fallback_reason.empty(), "reason should be reported");
                     require(report.store.coupons.size() == 1, "backup keeps unused coupons only");
                     require(report.store.coupons[0].id == "coupon_b", "wrong coupon restored");
                     require(report.store.coupons[0].description ==
                                 cp::kind_info(cp::CouponKind::FreeEvent).description,
                             "description should come from the kind table");
                     require(report.store.total_used == 1, "totals come from backup");
                     require(report.written_back, "recovered store should be written back");

                     fx.reopen();
                     require(fx.repo->load().source == cp::LoadSource::Primary,
                             "primary should be healthy after write-back");
                   }});

  tests.push_back({"repository_plaintext_primary_is_not_trusted", [] {
                     RepoFixture fx;
                     const auto store = two_coupon_store(fx.clock.now_ms());
                     fx.primary.set_raw(cp::PRIMARY_STORE_KEY, cp::encode_store(store));
                     const auto report = fx.repo->load();
                     require(report.source != cp::LoadSource::Primary,
                             "plaintext must never be parsed as a valid record");
                     require(report.store.coupons.empty(), "nothing should be trusted");
                   }});

  tests.push_back({"repository_both_media_unusable_gives_fresh_store", [] {
                     RepoFixture fx;
                     fx.primary.set_raw(cp::PRIMARY_STORE_KEY, "enc1:garbage");
                     fx.backup.set_raw(cp::BACKUP_STORE_KEY, "not even close");
                     const auto report = fx.repo->load();
                     require(report.source == cp::LoadSource::Fresh, "fresh expected");
                     require(report.store.coupons.empty() && report.store.history.empty(),
                             "fresh store is empty");
                     require(report.store.total_exchanged == 0, "fresh totals");
                   }});

  tests.push_back({"repository_unreadable_primary_is_served_read_only", [] {
                     RepoFixture fx;
                     const auto now = fx.clock.now_ms();
                     cp::CouponStore store;
                     for (int i = 0; i < 10; ++i) {
                       std::string code = "AAAA-BBBB-CC";
                       code.push_back(static_cast<char>('2' + i / 8));
                       code.push_back(static_cast<char>('2' + i % 8));
                       store.coupons.push_back(t::make_coupon("coupon_" + std::to_string(i), code,
                                                              now - 1000 - i,
                                                              now + 90 * kMillisPerDay));
                     }
                     store.history.push_back(cp::HistoryEntry{.id = "history_1",
                                                              .action = cp::HistoryAction::Exchange,
                                                              .coupon_id = "coupon_0",
                                                              .coupon_name = "Free Event Pass",
                                                              .points_spent = 50'000,
                                                              .timestamp = now - 1000});
                     store.total_exchanged = 10;
                     require(fx.repo->save(store).ok(), "save");
                     const int writes = fx.primary.put_count();

                     fx.primary.fail_get = true;
                     const auto degraded = fx.repo->load();
                     require(degraded.primary_unreadable, "read error must be told apart");
                     require(degraded.source == cp::LoadSource::Backup, "backup served");
                     require(degraded.store.coupons.size() == 5, "backup holds five coupons");
                     require(!degraded.written_back, "nothing written back");
                     require(fx.primary.put_count() == writes, "primary left alone");

                     fx.primary.heal();
                     const auto recovered = fx.repo->load();
                     require(recovered.source == cp::LoadSource::Primary, "primary again");
                     require(!recovered.primary_unreadable, "readable again");
                     require(recovered.store.coupons.size() == 10, "all ten coupons kept");
                     require(recovered.store.history.size() == 1, "history kept");
                     require(recovered.store.total_exchanged == 10, "totals kept");
                   }});

  tests.push_back({"repository_absent_primary_is_rebuilt_from_backup", [] {
                     RepoFixture fx;
                     require(fx.repo->save(two_coupon_store(fx.clock.now_ms())).ok(), "save");
                     require(fx.primary.remove(cp::PRIMARY_STORE_KEY).ok(), "drop primary");
                     const auto report = fx.repo->load();
                     require(report.source == cp::LoadSource::Backup, "backup expected");
                     require(!report.primary_unreadable, "absent is not unreadable");
                     require(report.store.coupons.size() == 2, "both unused coupons in backup");
                     require(report.written_back, "primary rebuilt");
                     require(fx.primary.raw(cp::PRIMARY_STORE_KEY).has_value(), "primary present");
                   }});

  tests.push_back({"repository_expiry_repair_is_idempotent", [] {
                     RepoFixture fx;
                     const auto now = fx.clock.now_ms();
                     cp::CouponStore store;
                     store.coupons.push_back(
                         t::make_coupon("coupon_live", "AAAA-BBBB-CCCC", now, now + kMillisPerDay));
                     store.coupons.push_back(t::make_coupon("coupon_old", "DDDD-EEEE-FFFF",
                                                            now - 91 * kMillisPerDay,
                                                            now - kMillisPerDay));
                     require(fx.repo->save(store).ok(), "save");

                     const auto first = fx.repo->load();
                     require(first.expired_coupons == 1, "one coupon should expire");
                     require(first.written_back, "repair should be persisted");
                     const auto *old = first.store.find("coupon_old");
                     require(old != nullptr && old->is_used, "expired coupon marked used");
                     require(old->used_at == old->expires_at, "usedAt stamped at expiry");
                     require(!old->verified_at.has_value(), "expiry is not a verification");
                     require(first.store.history.size() == 1, "one expire entry");
                     require(first.store.history[0].action == cp::HistoryAction::Expire, "action");
                     require(first.store.history[0].timestamp == old->expires_at,
                             "entry dated at expiry");
                     require(!first.store.find("coupon_live")->is_used, "live coupon untouched");

                     fx.reopen();
                     const auto second = fx.repo->load();
                     require(second.source == cp::LoadSource::Primary, "primary expected");
                     require(second.expired_coupons == 0, "nothing left to expire");
                     require(!second.written_back, "second load should not write");
                     require(second.store.history.size() == 1, "no duplicate expire entries");
                     require(cp::encode_store(second.store) == cp::encode_store(first.store),
                             "second load must match first");
                   }});

  tests.push_back({"repository_expire_entries_go_ahead_of_history_before_cap", [] {
                     cp::RepositoryOptions options;
                     options.max_history = 3;
                     RepoFixture fx(options);
                     const auto now = fx.clock.now_ms();
                     cp::CouponStore store;
                     for (int i = 0; i < 2; ++i) {
                       store.coupons.push_back(t::make_coupon(
                           "coupon_exp" + std::to_string(i), "", now - 100 * kMillisPerDay,
                           now - (i + 1) * kMillisPerDay));
                     }
                     for (int i = 0; i < 3; ++i) {
                       cp::HistoryEntry entry;
                       entry.id = "history_" + std::to_string(i);
                       entry.action = cp::HistoryAction::Exchange;
                       entry.coupon_id = "coupon_x";
                       entry.timestamp = now - 200 * kMillisPerDay - i;
                       store.history.push_back(entry);
                     }
                     require(fx.repo->save(store).ok(), "save");

                     const auto report = fx.repo->load();
                     require(report.store.history.size() == 3, "cap applies after prepend");
                     require(report.store.history[0].action == cp::HistoryAction::Expire, "0");
                     require(report.store.history[1].action == cp::HistoryAction::Expire, "1");
                     require(report.store.history[0].timestamp > report.store.history[1].timestamp,
                             "newest expiry first");
                     require(report.store.history[2].id == "history_0", "newest old entry kept");
                   }});

  tests.push_back({"repository_backfills_missing_codes", [] {
                     RepoFixture fx;
                     const auto now = fx.clock.now_ms();
                     cp::CouponStore store;
                     store.coupons.push_back(
                         t::make_coupon("coupon_legacy", "", now, now + kMillisPerDay));
                     require(fx.repo->save(store).ok(), "save");

                     const auto report = fx.repo->load();
                     require(report.backfilled_codes == 1, "one code should be backfilled");
                     const auto &code = report.store.coupons[0].secret_code;
                     require(cp::is_well_formed_code(cp::normalize_code(code)), "code: " + code);

                     fx.reopen();
                     const auto again = fx.repo->load();
                     require(again.backfilled_codes == 0, "backfill happens once");
                     require(again.store.coupons[0].secret_code == code, "code must be stable");
                   }});

  tests.push_back({"repository_migrates_legacy_fields_and_drops_malformed", [] {
                     RepoFixture fx;
                     fx.seal_primary(
                         R"({"coupons":[)"
                         R"({"id":"coupon_1","type":"discount","secretCode":"AAAA-BBBB-CCCC","createdAt":1,"expiresAt":99999999999999,"isUsed":false},)"
                         R"({"id":"coupon_2","type":"mystery","createdAt":1,"expiresAt":2,"isUsed":false},)"
                         R"({"id":"","type":"special","createdAt":1,"expiresAt":2})"
                         R"(],"history":[{"id":"h1","action":"exchange","couponId":"coupon_1","timestamp":"soon"}],)"
                         R"("totalExchanged":1,"totalUsed":0})");
                     const auto report = fx.repo->load();
                     require(report.source == cp::LoadSource::Primary, "record is valid");
                     require(report.store.coupons.size() == 1, "malformed coupons dropped");
                     require(report.store.coupons[0].name ==
                                 cp::kind_info(cp::CouponKind::Discount).name,
                             "name from kind table");
                     require(report.store.history.empty(), "non-numeric timestamp dropped");
                     require(report.dropped_entries == 3, "three dropped entries");
                     require(report.written_back, "repairs should be persisted");
                   }});

  tests.push_back({"repository_rejects_oversized_arrays", [] {
                     cp::RepositoryOptions options;
                     options.max_coupons = 2;
                     options.corruption_factor = 2;
                     RepoFixture fx(options);
                     cp::CouponStore store;
                     const auto now = fx.clock.now_ms();
                     for (int i = 0; i < 5; ++i) {
                       store.coupons.push_back(t::make_coupon("coupon_" + std::to_string(i),
                                                              "AAAA-BBBB-CCC" + std::string(1, 'D' + i),
                                                              now, now + kMillisPerDay));
                     }
                     fx.seal_primary(cp::encode_store(store));
                     const auto report = fx.repo->load();
                     require(report.source != cp::LoadSource::Primary,
                             "oversized record must be discarded whole");
                   }});

  tests.push_back({"repository_backup_degrades_to_metadata_over_ceiling", [] {
                     cp::RepositoryOptions options;
                     options.backup_max_bytes = 600;
                     RepoFixture fx(options);
                     const auto now = fx.clock.now_ms();
                     cp::CouponStore store;
                     for (int i = 0; i < 5; ++i) {
                       store.coupons.push_back(t::make_coupon(
                           "coupon_" + std::to_string(i), "AAAA-BBBB-CCC" + std::string(1, 'D' + i),
                           now, now + kMillisPerDay));
                     }
                     store.total_exchanged = 5;
                     require(fx.repo->save(store).ok(), "save");
                     const auto backup = fx.backup.raw(cp::BACKUP_STORE_KEY);
                     require(backup.has_value() && backup->size() <= 600, "backup within ceiling");
                     const auto plain = sec::decrypt_secret(t::test_key(), *backup);
                     require(plain.ok(), plain.error());
                     const auto record = cp::decode_backup(plain.value());
                     require(record.ok(), record.error());
                     require(record.value().kind == cp::BackupKind::Metadata, "metadata expected");
                     require(record.value().coupon_count == 5, "count recorded");
                     require(record.value().available_count == 5, "available recorded");

                     fx.primary.set_raw(cp::PRIMARY_STORE_KEY, "enc1:broken");
                     const auto report = fx.repo->load();
                     require(report.source == cp::LoadSource::Backup, "metadata still restores");
                     require(report.store.coupons.empty(), "metadata carries no coupons");
                     require(report.store.total_exchanged == 5, "totals restored");
                   }});

  tests.push_back({"repository_default_backup_fits_two_kilobytes", [] {
                     RepoFixture fx;
                     const auto now = fx.clock.now_ms();
                     cp::CouponStore store;
                     for (int i = 0; i < 20; ++i) {
                       auto coupon = t::make_coupon("coupon_m1abcdef_abcdef" + std::to_string(i % 10),
                                                    "AAAA-BBBB-CCC" + std::string(1, 'D' + i % 10),
                                                    now, now + 90 * kMillisPerDay);
                       coupon.kind = cp::CouponKind::Discount;
                       coupon.name = cp::kind_info(coupon.kind).name;
                       store.coupons.push_back(coupon);
                     }
                     require(fx.repo->save(store).ok(), "save");
                     const auto backup = fx.backup.raw(cp::BACKUP_STORE_KEY);
                     require(backup.has_value() && backup->size() <= 2048, "2 KB ceiling");
                     const auto record = cp::decode_backup(
                         sec::decrypt_secret(t::test_key(), *backup).value());
                     require(record.ok(), record.error());
                     require(record.value().kind == cp::BackupKind::Coupons, "coupon backup fits");
                     require(record.value().coupons.size() == 5, "trimmed to five coupons");
                   }});

  tests.push_back({"repository_save_fails_on_primary_write_error", [] {
                     RepoFixture fx;
                     fx.primary.fail_put = true;
                     require(!fx.repo->save(two_coupon_store(fx.clock.now_ms())).ok(),
                             "write failure must be reported");
                   }});

  tests.push_back({"repository_save_verifies_by_reading_back", [] {
                     RepoFixture fx;
                     fx.primary.drop_writes = true;
                     const auto status = fx.repo->save(two_coupon_store(fx.clock.now_ms()));
                     require(!status.ok(), "lost write must be detected");
                   }});

  tests.push_back({"repository_failed_read_back_restores_previous_record", [] {
                     RepoFixture fx;
                     const auto now = fx.clock.now_ms();
                     require(fx.repo->save(two_coupon_store(now)).ok(), "first save");
                     const auto before = fx.primary.raw(cp::PRIMARY_STORE_KEY);
                     const auto backup_before = fx.backup.raw(cp::BACKUP_STORE_KEY);

                     auto grown = two_coupon_store(now);
                     grown.coupons.insert(grown.coupons.begin(),
                                          t::make_coupon("coupon_c", "CCCC-DDDD-EEEE", now,
                                                         now + 90 * kMillisPerDay));
                     grown.total_exchanged = 3;
                     fx.primary.fail_get_after_put = true;
                     require(!fx.repo->save(grown).ok(), "unverified write must fail");

                     fx.primary.heal();
                     require(fx.primary.raw(cp::PRIMARY_STORE_KEY) == before, "previous record back");
                     require(fx.backup.raw(cp::BACKUP_STORE_KEY) == backup_before,
                             "backup untouched by a failed save");
                     fx.reopen();
                     const auto report = fx.repo->load();
                     require(report.store.coupons.size() == 2, "third coupon not durable");
                     require(report.store.total_exchanged == 2, "totals not durable");
                   }});

  tests.push_back({"repository_failed_first_read_back_leaves_no_record", [] {
                     RepoFixture fx;
                     fx.primary.fail_get_after_put = true;
                     require(!fx.repo->save(two_coupon_store(fx.clock.now_ms())).ok(), "fails");
                     fx.primary.heal();
                     require(!fx.primary.raw(cp::PRIMARY_STORE_KEY).has_value(),
                             "unverified first record removed");
                   }});

  tests.push_back({"repository_save_refuses_when_primary_unreadable", [] {
                     RepoFixture fx;
                     require(fx.repo->save(two_coupon_store(fx.clock.now_ms())).ok(), "save");
                     const int writes = fx.primary.put_count();
                     fx.primary.fail_get = true;
                     require(!fx.repo->save(cp::CouponStore{}).ok(), "save must refuse");
                     require(fx.primary.put_count() == writes, "no blind overwrite");
                   }});

  tests.push_back({"repository_backup_failure_does_not_fail_save", [] {
                     RepoFixture fx;
                     fx.backup.fail_put = true;
                     require(fx.repo->save(two_coupon_store(fx.clock.now_ms())).ok(),
                             "backup is best effort");
                   }});

  tests.push_back({"repository_lockout_record_roundtrip", [] {
                     RepoFixture fx;
                     const auto empty = fx.repo->load_lockout();
                     require(empty.ok() && empty.value() == cp::LockoutState{}, "fresh lockout");
                     const cp::LockoutState state{.failed_attempts = 2, .locked_until = 12345};
                     require(fx.repo->save_lockout(state).ok(), "save lockout");
                     const auto raw = fx.primary.raw(cp::LOCKOUT_STORE_KEY);
                     require(raw.has_value() && sec::is_encrypted_blob(*raw), "lockout sealed");
                     fx.reopen();
                     const auto loaded = fx.repo->load_lockout();
                     require(loaded.ok() && loaded.value() == state, "lockout roundtrip");

                     fx.primary.set_raw(cp::LOCKOUT_STORE_KEY, R"({"attempts":0,"lockoutUntil":0})");
                     require(!fx.repo->load_lockout().ok(), "plaintext lockout rejected");
                   }});
}

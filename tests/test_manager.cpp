#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "couponvault/coupons/code_generator.hpp"
#include "couponvault/coupons/manager.hpp"

#include <cctype>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace {

namespace cp = couponvault::coupons;
namespace t = couponvault::testing;

using couponvault::common::kMillisPerDay;
using couponvault::tests::require;

constexpr std::int64_t COST = 50'000;

cp::Coupon exchange_one(t::CouponHarness &h, t::FakeLedger &ledger,
                        cp::CouponKind kind = cp::CouponKind::FreeEvent) {
  const auto outcome = h.mgr().exchange(ledger.balance(), kind);
  require(outcome.success, "exchange failed: " + outcome.message);
  require(outcome.coupon.has_value(), "coupon expected");
  return *outcome.coupon;
}

} // namespace

void register_manager_tests(std::vector<couponvault::tests::TestCase> &tests) {
  tests.push_back({"manager_exchange_scenario", [] {
                     t::CouponHarness h(cp::ManagerOptions{});
                     auto &ledger = h.fund(COST);
                     require(h.mgr().coupons().empty(), "starts empty");

                     const auto outcome = h.mgr().exchange(ledger.balance());
                     require(outcome.success, outcome.message);
                     require(outcome.code == cp::CouponErrorCode::None, "no error code");
                     require(h.mgr().coupons().size() == 1, "one coupon");
                     require(h.mgr().total_exchanged() == 1, "total exchanged");
                     require(ledger.balance() == 0, "balance spent");
                     require(outcome.message.find("50,000") != std::string::npos,
                             "message shows points: " + outcome.message);

                     const auto &coupon = *outcome.coupon;
                     require(coupon.name == "Free Event Pass", "kind table name");
                     require(coupon.expires_at == coupon.created_at + 90 * kMillisPerDay,
                             "ninety day expiry");
                     require(cp::is_well_formed_code(cp::normalize_code(coupon.secret_code)),
                             "well formed code");
                     require(coupon.id.rfind("coupon_", 0) == 0, "coupon id prefix");

                     const auto history = h.mgr().history();
                     require(history.size() == 1 && history[0].action == cp::HistoryAction::Exchange,
                             "exchange entry");
                     require(history[0].points_spent == COST, "points recorded");

                     const auto second = h.mgr().exchange(ledger.balance());
                     require(second.code == cp::CouponErrorCode::InsufficientBalance,
                             "second exchange should be short of points");
                     require(ledger.spend_calls() == 1, "no second charge attempt");
                   }});

  tests.push_back({"manager_exchange_uses_kind_table", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST * 2);
                     const auto discount = exchange_one(h, ledger, cp::CouponKind::Discount);
                     require(discount.name == "50% Discount Coupon", "discount name");
                     const auto special = exchange_one(h, ledger, cp::CouponKind::Special);
                     require(special.name == "Special Coupon", "special name");
                     require(!special.description.empty(), "description filled");
                     require(h.mgr().coupons().front().id == special.id, "newest first");
                   }});

  tests.push_back({"manager_exchange_cooldown", [] {
                     auto options = t::default_manager_options();
                     options.exchange_cooldown_ms = 5'000;
                     t::CouponHarness h(options);
                     auto &ledger = h.fund(COST * 3);
                     exchange_one(h, ledger);

                     const auto blocked = h.mgr().exchange(ledger.balance());
                     require(blocked.code == cp::CouponErrorCode::Cooldown, "cooldown expected");
                     require(blocked.retry_after_ms == 5'000, "retry after full window");
                     require(ledger.spend_calls() == 1, "cooldown must not charge");

                     h.clock.advance(4'999);
                     require(h.mgr().exchange(ledger.balance()).code ==
                                 cp::CouponErrorCode::Cooldown,
                             "still cooling down");
                     h.clock.advance(1);
                     exchange_one(h, ledger);
                   }});

  tests.push_back({"manager_cooldown_counts_failed_attempts", [] {
                     auto options = t::default_manager_options();
                     options.exchange_cooldown_ms = 5'000;
                     t::CouponHarness h(options);
                     auto &ledger = h.fund(COST);
                     ledger.refuse_spend = true;
                     const auto refused = h.mgr().exchange(COST);
                     require(!refused.success, "refused spend fails");
                     ledger.refuse_spend = false;
                     require(h.mgr().exchange(COST).code == cp::CouponErrorCode::Cooldown,
                             "window starts even when the exchange failed");
                   }});

  tests.push_back({"manager_exchange_capacity", [] {
                     auto options = t::default_manager_options();
                     options.max_live_coupons = 2;
                     t::CouponHarness h(options);
                     auto &ledger = h.fund(COST * 3);
                     exchange_one(h, ledger);
                     exchange_one(h, ledger);
                     require(!h.mgr().can_exchange(ledger.balance()), "at capacity");
                     const auto full = h.mgr().exchange(ledger.balance());
                     require(full.code == cp::CouponErrorCode::CapacityExceeded, "capacity");
                     require(ledger.balance() == COST, "capacity check must not charge");

                     require(h.mgr().use_directly(h.mgr().coupons().front().id).success, "use");
                     exchange_one(h, ledger);
                   }});

  tests.push_back({"manager_entropy_failure_stops_before_charge", [] {
                     t::CouponHarness h;
                     h.use_codes(std::make_unique<t::FailingCodeGenerator>());
                     auto &ledger = h.fund(COST);
                     const auto outcome = h.mgr().exchange(ledger.balance());
                     require(outcome.code == cp::CouponErrorCode::EntropyUnavailable, "entropy");
                     require(ledger.spend_calls() == 0, "no spend without a code");
                     require(h.mgr().coupons().empty(), "no coupon issued");
                   }});

  tests.push_back({"manager_regenerates_colliding_code", [] {
                     t::CouponHarness h;
                     h.use_codes(std::make_unique<t::ScriptedCodeGenerator>(std::vector<std::string>{
                         "AAAA-BBBB-CCCC", "AAAA-BBBB-CCCC", "DDDD-EEEE-FFFF"}));
                     auto &ledger = h.fund(COST * 2);
                     const auto first = exchange_one(h, ledger);
                     const auto second = exchange_one(h, ledger);
                     require(first.secret_code == "AAAA-BBBB-CCCC", "first code");
                     require(second.secret_code == "DDDD-EEEE-FFFF", "collision skipped");
                   }});

  tests.push_back({"manager_refused_spend_issues_nothing", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     ledger.refuse_spend = true;
                     const int writes = h.primary->put_count();
                     const auto outcome = h.mgr().exchange(COST);
                     require(!outcome.success, "refused spend fails");
                     require(h.mgr().coupons().empty(), "no coupon");
                     require(h.mgr().total_exchanged() == 0, "totals untouched");
                     require(h.primary->put_count() == writes, "nothing persisted");
                   }});

  tests.push_back({"manager_throwing_ledger_does_not_escape", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     ledger.throw_on_spend = true;
                     const auto outcome = h.mgr().exchange(COST);
                     require(!outcome.success, "throwing spend fails");
                     require(h.mgr().coupons().empty(), "no coupon");
                   }});

  tests.push_back({"manager_save_failure_refunds", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     h.primary->fail_put = true;
                     const auto outcome = h.mgr().exchange(ledger.balance());
                     require(outcome.code == cp::CouponErrorCode::PersistenceFailure, "code");
                     require(outcome.refunded && !outcome.charged, "refund expected");
                     require(ledger.balance() == COST, "balance restored");
                     require(ledger.add_calls() == 1, "one refund call");
                     require(h.mgr().coupons().empty(), "nothing published before persistence");
                     require(h.mgr().total_exchanged() == 0, "totals unchanged");
                   }});

  tests.push_back({"manager_lost_write_refunds", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     h.primary->drop_writes = true;
                     const auto outcome = h.mgr().exchange(ledger.balance());
                     require(outcome.refunded, "unverified write must refund");
                     require(ledger.balance() == COST, "balance restored");
                   }});

  tests.push_back({"manager_failed_read_back_is_not_durable_after_refund", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     h.primary->fail_get_after_put = true;
                     const auto outcome = h.mgr().exchange(ledger.balance());
                     require(outcome.refunded, "unverified write must refund");
                     require(ledger.balance() == COST, "balance restored");

                     h.primary->heal();
                     h.rebuild();
                     require(h.mgr().coupons().empty(), "refunded coupon must not survive restart");
                     require(h.mgr().total_exchanged() == 0, "totals agree with the refund");
                   }});

  tests.push_back({"manager_failed_read_back_keeps_coupon_available", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     const auto coupon = exchange_one(h, ledger);
                     h.primary->fail_get_after_put = true;
                     require(h.mgr().use_directly(coupon.id).code ==
                                 cp::CouponErrorCode::PersistenceFailure,
                             "persistence failure");

                     h.primary->heal();
                     h.rebuild();
                     require(h.mgr().available_coupons().size() == 1, "still available after restart");
                     require(h.mgr().total_used() == 0, "total used unchanged");
                     require(h.mgr().verify_by_code(coupon.secret_code).success, "verifies later");
                   }});

  tests.push_back({"manager_unreadable_primary_blocks_mutations_until_it_recovers", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST * 2);
                     const auto first = exchange_one(h, ledger);

                     h.primary->fail_get = true;
                     const auto report = h.mgr().reload();
                     require(report.ok(), report.error());
                     require(report.value().primary_unreadable, "read error reported");
                     require(h.mgr().coupons().size() == 1, "backup served to readers");

                     const int writes = h.primary->put_count();
                     const auto blocked = h.mgr().exchange(ledger.balance());
                     require(blocked.code == cp::CouponErrorCode::PersistenceFailure, "blocked");
                     require(ledger.spend_calls() == 1, "no charge while storage is unreadable");
                     require(h.mgr().use_directly(first.id).code ==
                                 cp::CouponErrorCode::PersistenceFailure,
                             "use blocked");
                     require(h.mgr().flush().ok(), "flush skips an unloaded store");
                     require(h.primary->put_count() == writes, "primary never overwritten");

                     h.primary->heal();
                     exchange_one(h, ledger);
                     require(h.mgr().coupons().size() == 2, "primary reloaded before the write");
                     require(h.mgr().total_exchanged() == 2, "totals from the primary");
                   }});

  tests.push_back({"manager_failed_refund_says_charged", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     ledger.refuse_add = true;
                     h.primary->fail_put = true;
                     const auto outcome = h.mgr().exchange(ledger.balance());
                     require(outcome.code == cp::CouponErrorCode::PersistenceFailure, "code");
                     require(outcome.charged && !outcome.refunded, "charged flag");
                     require(outcome.message.find("charged") != std::string::npos,
                             "message must say the balance was charged: " + outcome.message);
                     require(ledger.balance() == 0, "points are gone");
                   }});

  tests.push_back({"manager_throwing_store_after_charge_refunds", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     h.primary->throw_on_put = true;
                     const auto outcome = h.mgr().exchange(ledger.balance());
                     require(!outcome.success && outcome.refunded, "fault converted to refund");
                     require(ledger.balance() == COST, "balance restored");
                   }});

  tests.push_back({"manager_exchange_admits_one_of_many_concurrent_calls", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     constexpr int CALLERS = 100;

                     std::mutex mutex;
                     std::condition_variable cv;
                     int busy = 0;
                     // Hold the one admitted call inside spend until every other caller bounced.
                     ledger.before_spend = [&] {
                       std::unique_lock<std::mutex> lock(mutex);
                       cv.wait_for(lock, std::chrono::seconds(10),
                                   [&] { return busy == CALLERS - 1; });
                     };

                     std::vector<cp::CouponOutcome> outcomes(CALLERS);
                     std::vector<std::thread> threads;
                     threads.reserve(CALLERS);
                     for (int i = 0; i < CALLERS; ++i) {
                       threads.emplace_back([&, i] {
                         outcomes[i] = h.mgr().exchange(COST);
                         if (outcomes[i].code == cp::CouponErrorCode::Busy) {
                           std::lock_guard<std::mutex> lock(mutex);
                           ++busy;
                           cv.notify_all();
                         }
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }

                     int succeeded = 0;
                     int busy_count = 0;
                     for (const auto &outcome : outcomes) {
                       succeeded += outcome.success ? 1 : 0;
                       busy_count += outcome.code == cp::CouponErrorCode::Busy ? 1 : 0;
                     }
                     require(succeeded == 1, "exactly one success, got " + std::to_string(succeeded));
                     require(busy_count == CALLERS - 1, "others busy, got " + std::to_string(busy_count));
                     require(ledger.successful_spends() == 1, "exactly one charge");
                     require(h.mgr().coupons().size() == 1, "exactly one coupon");
                   }});

  tests.push_back({"manager_use_directly_paths", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     const auto coupon = exchange_one(h, ledger);

                     require(h.mgr().use_directly("coupon_missing").code ==
                                 cp::CouponErrorCode::NotFound,
                             "not found");
                     const auto used = h.mgr().use_directly(coupon.id);
                     require(used.success, used.message);
                     require(used.coupon->is_used && used.coupon->used_at.has_value(), "stamped");
                     require(!used.coupon->verified_at.has_value(), "direct use is not verified");
                     require(h.mgr().total_used() == 1, "total used");
                     require(h.mgr().history().front().action == cp::HistoryAction::Use, "history");
                     require(!h.mgr().history().front().points_spent.has_value(), "no points");
                     require(h.mgr().use_directly(coupon.id).code == cp::CouponErrorCode::AlreadyUsed,
                             "already used");
                     require(h.mgr().available_coupons().empty(), "nothing available");
                   }});

  tests.push_back({"manager_use_directly_rejects_expired", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     const auto coupon = exchange_one(h, ledger);
                     h.clock.advance(90 * kMillisPerDay);
                     require(h.mgr().use_directly(coupon.id).code == cp::CouponErrorCode::Expired,
                             "expired");
                     require(h.mgr().available_coupons().empty(), "expired is not available");
                   }});

  tests.push_back({"manager_use_persistence_failure_leaves_coupon", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     const auto coupon = exchange_one(h, ledger);
                     h.primary->fail_put = true;
                     require(h.mgr().use_directly(coupon.id).code ==
                                 cp::CouponErrorCode::PersistenceFailure,
                             "persistence failure");
                     require(h.mgr().available_coupons().size() == 1, "still available");
                     require(h.mgr().total_used() == 0, "total unchanged");
                   }});

  tests.push_back({"manager_verify_by_code", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     const auto coupon = exchange_one(h, ledger);
                     h.clock.advance(1000);

                     std::string typed = cp::normalize_code(coupon.secret_code);
                     for (auto &ch : typed) {
                       ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
                     }
                     const auto outcome = h.mgr().verify_by_code("  " + typed + " ");
                     require(outcome.success, outcome.message);
                     require(outcome.coupon->id == coupon.id, "matched coupon");
                     require(outcome.coupon->verified_at == h.clock.now_ms(), "verified stamp");
                     require(outcome.coupon->used_at == h.clock.now_ms(), "used stamp");
                     require(h.mgr().total_used() == 1, "total used");
                   }});

  tests.push_back({"manager_verify_wrong_code_counts_attempts", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     exchange_one(h, ledger);
                     const auto first = h.mgr().verify_by_code("ZZZZ-ZZZZ-ZZZZ");
                     require(first.code == cp::CouponErrorCode::NotFound, "no match");
                     require(first.remaining_attempts == 2, "two attempts left");
                     require(first.message.find("2 attempts") != std::string::npos,
                             "message shows remaining: " + first.message);
                     require(h.mgr().lockout_status().failed_attempts == 1, "counter");
                   }});

  tests.push_back({"manager_verify_short_input_is_free", [] {
                     t::CouponHarness h;
                     const auto outcome = h.mgr().verify_by_code("ABCD-EF");
                     require(outcome.code == cp::CouponErrorCode::InvalidInput, "invalid input");
                     require(h.mgr().lockout_status().failed_attempts == 0, "no attempt charged");
                   }});

  tests.push_back({"manager_verify_lockout_boundary", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     const auto coupon = exchange_one(h, ledger);
                     (void)h.mgr().verify_by_code("ZZZZ-ZZZZ-ZZZ2");
                     (void)h.mgr().verify_by_code("ZZZZ-ZZZZ-ZZZ3");
                     const auto third = h.mgr().verify_by_code("ZZZZ-ZZZZ-ZZZ4");
                     require(third.code == cp::CouponErrorCode::LockedOut, "third locks");
                     const auto unlock_at = h.clock.now_ms() + 5 * 60 * 1000;
                     require(h.mgr().lockout_status().locked_until == unlock_at, "unlock time");

                     h.clock.set(unlock_at - 1);
                     const auto blocked = h.mgr().verify_by_code(coupon.secret_code);
                     require(blocked.code == cp::CouponErrorCode::LockedOut,
                             "even the right code is rejected while locked");
                     require(blocked.message.find("1 second") != std::string::npos,
                             "remaining time shown: " + blocked.message);
                     require(h.mgr().available_coupons().size() == 1, "coupon untouched");

                     h.clock.set(unlock_at);
                     const auto allowed = h.mgr().verify_by_code(coupon.secret_code);
                     require(allowed.success, "processed at the boundary: " + allowed.message);
                   }});

  tests.push_back({"manager_single_use_terminal_state", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     const auto coupon = exchange_one(h, ledger);
                     require(h.mgr().use_directly(coupon.id).success, "use");

                     (void)h.mgr().verify_by_code("ZZZZ-ZZZZ-ZZZZ");
                     const auto again = h.mgr().verify_by_code(coupon.secret_code);
                     require(again.code == cp::CouponErrorCode::AlreadyUsed, "already used");
                     require(h.mgr().lockout_status().failed_attempts == 1,
                             "a used coupon must not reset the attempt counter");
                     require(h.mgr().use_directly(coupon.id).code == cp::CouponErrorCode::AlreadyUsed,
                             "still used");
                     require(h.mgr().coupons().front().is_used, "terminal");
                   }});

  tests.push_back({"manager_verify_expired_code", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     const auto coupon = exchange_one(h, ledger);
                     (void)h.mgr().verify_by_code("ZZZZ-ZZZZ-ZZZZ");
                     require(h.mgr().lockout_status().failed_attempts == 1, "one miss");
                     h.clock.advance(91 * kMillisPerDay);
                     require(h.mgr().verify_by_code(coupon.secret_code).code ==
                                 cp::CouponErrorCode::Expired,
                             "expired");
                     require(h.mgr().lockout_status().failed_attempts == 1,
                             "an expired coupon must not reset the attempt counter");
                   }});

  tests.push_back({"manager_state_survives_restart", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST * 2);
                     const auto first = exchange_one(h, ledger);
                     exchange_one(h, ledger);
                     require(h.mgr().use_directly(first.id).success, "use");
                     (void)h.mgr().verify_by_code("ZZZZ-ZZZZ-ZZZZ");

                     h.rebuild();
                     require(h.mgr().coupons().size() == 2, "coupons reloaded");
                     require(h.mgr().total_exchanged() == 2 && h.mgr().total_used() == 1, "totals");
                     require(h.mgr().history().size() == 3, "history reloaded");
                     require(h.mgr().lockout_status().failed_attempts == 1,
                             "attempt counter survives restart");
                   }});

  tests.push_back({"manager_reload_applies_expiry", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     exchange_one(h, ledger);
                     h.clock.advance(90 * kMillisPerDay);
                     const auto report = h.mgr().reload();
                     require(report.ok(), report.error());
                     require(report.value().expired_coupons == 1, "expired on reload");
                     require(h.mgr().history().front().action == cp::HistoryAction::Expire,
                             "expire entry");
                   }});

  tests.push_back({"manager_flush_writes_snapshot", [] {
                     t::CouponHarness h;
                     auto &ledger = h.fund(COST);
                     exchange_one(h, ledger);
                     h.primary->set_raw(cp::PRIMARY_STORE_KEY, "enc1:lost");
                     require(h.mgr().flush().ok(), "flush");
                     h.rebuild();
                     require(h.mgr().coupons().size() == 1, "flushed state reloads");
                   }});

  tests.push_back({"manager_projections", [] {
                     t::CouponHarness h;
                     require(h.mgr().can_exchange(COST), "enough points");
                     require(!h.mgr().can_exchange(COST - 1), "one short");
                     require(h.mgr().points_needed_for_coupon(12'000) == 38'000, "needed");
                     require(h.mgr().points_needed_for_coupon(90'000) == 0, "never negative");
                     require(!h.mgr().lockout_status().locked, "unlocked");
                     require(h.mgr().lockout_status().remaining_attempts == 3, "full budget");
                   }});

  tests.push_back({"format_points_groups_thousands", [] {
                     require(cp::format_points(0) == "0", "zero");
                     require(cp::format_points(999) == "999", "three digits");
                     require(cp::format_points(50'000) == "50,000", "fifty thousand");
                     require(cp::format_points(1'234'567) == "1,234,567", "millions");
                     require(cp::format_points(-1'500) == "-1,500", "negative");
                   }});

  tests.push_back({"manager_history_is_capped", [] {
                     auto options = t::default_manager_options();
                     options.max_history = 3;
                     t::CouponHarness h(options);
                     auto &ledger = h.fund(COST * 4);
                     for (int i = 0; i < 4; ++i) {
                       exchange_one(h, ledger);
                     }
                     require(h.mgr().history().size() == 3, "history capped");
                     require(h.mgr().total_exchanged() == 4, "totals keep counting");
                   }});
}

#include "couponvault/coupons/manager.hpp"

#include "couponvault/observability/global.hpp"
#include "couponvault/security/constant_time.hpp"
#include "couponvault/security/secrets.hpp"

#include <algorithm>
#include <chrono>
#include <unordered_set>

namespace couponvault::coupons {

namespace {

constexpr std::size_t COUPON_ID_RANDOM_CHARS = 7;
constexpr std::size_t CODE_COLLISION_RETRIES = 8;
constexpr const char *EXCHANGE_REASON = "coupon exchange";
constexpr const char *REFUND_REASON = "exchange failure refund";

class ScopedLatency {
public:
  explicit ScopedLatency(const char *operation)
      : operation_(operation), start_(std::chrono::steady_clock::now()) {}
  ~ScopedLatency() {
    observability::record_metric(observability::OperationLatencyMetric{
        .operation = operation_,
        .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_)});
  }
  ScopedLatency(const ScopedLatency &) = delete;
  ScopedLatency &operator=(const ScopedLatency &) = delete;

private:
  const char *operation_;
  std::chrono::steady_clock::time_point start_;
};

CouponOutcome failure(const CouponErrorCode code, std::string message) {
  CouponOutcome outcome;
  outcome.code = code;
  outcome.message = std::move(message);
  return outcome;
}

CouponOutcome busy() {
  return failure(CouponErrorCode::Busy, "Another coupon operation is in progress. Please retry.");
}

std::int64_t ceil_seconds(const TimestampMs ms) {
  return (ms + common::kMillisPerSecond - 1) / common::kMillisPerSecond;
}

std::string plural(const std::int64_t count, const std::string &noun) {
  return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
}

CouponOutcome locked_out(const TimestampMs retry_after_ms) {
  auto outcome =
      failure(CouponErrorCode::LockedOut, "Too many failed attempts. Try again in " +
                                              plural(ceil_seconds(retry_after_ms), "second") + ".");
  outcome.retry_after_ms = retry_after_ms;
  return outcome;
}

} // namespace

const char *to_string(const CouponErrorCode code) {
  switch (code) {
  case CouponErrorCode::None:
    return "none";
  case CouponErrorCode::Busy:
    return "busy";
  case CouponErrorCode::Cooldown:
    return "cooldown";
  case CouponErrorCode::InsufficientBalance:
    return "insufficient_balance";
  case CouponErrorCode::CapacityExceeded:
    return "capacity_exceeded";
  case CouponErrorCode::NotFound:
    return "not_found";
  case CouponErrorCode::AlreadyUsed:
    return "already_used";
  case CouponErrorCode::Expired:
    return "expired";
  case CouponErrorCode::PersistenceFailure:
    return "persistence_failure";
  case CouponErrorCode::LockedOut:
    return "locked_out";
  case CouponErrorCode::InvalidInput:
    return "invalid_input";
  case CouponErrorCode::EntropyUnavailable:
    return "entropy_unavailable";
  }
  return "unknown";
}

std::string format_points(const std::int64_t points) {
  const bool negative = points < 0;
  std::string digits = std::to_string(negative ? -points : points);
  std::string out;
  out.reserve(digits.size() + digits.size() / 3 + 1);
  const std::size_t lead = digits.size() % 3 == 0 ? 3 : digits.size() % 3;
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i >= lead && (i - lead) % 3 == 0) {
      out.push_back(',');
    }
    out.push_back(digits[i]);
  }
  return negative ? "-" + out : out;
}

CouponManager::CouponManager(CouponRepository &repository, VerificationGuard &guard,
                             ICodeGenerator &codes, PointsLedger &ledger,
                             const common::Clock &clock, ManagerOptions options)
    : CouponManager(repository, guard, codes, ledger, clock, options,
                    security::secure_random_bytes) {}

CouponManager::CouponManager(CouponRepository &repository, VerificationGuard &guard,
                             ICodeGenerator &codes, PointsLedger &ledger,
                             const common::Clock &clock, ManagerOptions options,
                             RandomFill id_fill)
    : repository_(repository), guard_(guard), codes_(codes), ledger_(ledger), clock_(clock),
      options_(options), id_fill_(std::move(id_fill)), history_(options.max_history, id_fill_) {}

common::Result<LoadReport> CouponManager::initialize() {
  OperationLock::Guard lock(operation_lock_);
  if (!lock.owns()) {
    return common::Result<LoadReport>::failure("busy");
  }
  return load_locked();
}

common::Result<LoadReport> CouponManager::load_locked() {
  try {
    auto report = repository_.load();
    const auto restored = guard_.restore();
    if (!restored.ok()) {
      observability::record_error("manager", "lockout restore: " + restored.error());
    }
    publish(report.store);
    {
      std::lock_guard<std::mutex> state_lock(state_mutex_);
      // An unreadable primary is retried by the next mutation instead of being overwritten.
      loaded_ = !report.primary_unreadable;
    }
    return common::Result<LoadReport>::success(std::move(report));
  } catch (const std::exception &e) {
    observability::record_error("manager", std::string("load failed: ") + e.what());
    return common::Result<LoadReport>::failure(e.what());
  }
}

bool CouponManager::ensure_loaded_locked() {
  {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    if (loaded_) {
      return true;
    }
  }
  const auto report = load_locked();
  if (!report.ok()) {
    observability::record_error("manager", "lazy load failed: " + report.error());
    return false;
  }
  return !report.value().primary_unreadable;
}

CouponStore CouponManager::snapshot() const {
  std::lock_guard<std::mutex> state_lock(state_mutex_);
  return state_;
}

void CouponManager::publish(CouponStore next) {
  const auto live = next.available_count_at(clock_.now_ms());
  {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    state_ = std::move(next);
  }
  observability::record_metric(observability::LiveCouponsMetric{.count = live});
}

common::Status CouponManager::persist(const CouponStore &next) {
  try {
    return repository_.save(next);
  } catch (const std::exception &e) {
    return common::Status::error(std::string("save threw: ") + e.what());
  }
}

CouponOutcome CouponManager::exchange(const std::int64_t point_balance,
                                      const CouponKind kind) {
  ScopedLatency latency("exchange");
  OperationLock::Guard lock(operation_lock_);
  if (!lock.owns()) {
    return busy();
  }

  bool charged = false;
  try {
    return exchange_locked(point_balance, kind, charged);
  } catch (const std::exception &e) {
    observability::record_error("manager", std::string("exchange failed: ") + e.what());
    if (charged) {
      return refund_after_failure(e.what());
    }
    return failure(CouponErrorCode::PersistenceFailure,
                   "Something went wrong. No coupon was issued and no points were spent.");
  }
}

CouponOutcome CouponManager::exchange_locked(const std::int64_t point_balance,
                                             const CouponKind kind, bool &charged) {
  const auto now = clock_.now_ms();
  // Balance is checked ahead of the throttle so an empty wallet is never told to wait.
  if (point_balance < options_.cost_per_coupon) {
    return failure(CouponErrorCode::InsufficientBalance,
                   "Not enough points. You need " +
                       format_points(options_.cost_per_coupon - point_balance) + " more points.");
  }
  if (last_exchange_start_.has_value() &&
      now - *last_exchange_start_ < options_.exchange_cooldown_ms) {
    const auto wait_ms = options_.exchange_cooldown_ms - (now - *last_exchange_start_);
    auto outcome =
        failure(CouponErrorCode::Cooldown, "Please wait " + plural(ceil_seconds(wait_ms), "second") +
                                               " before exchanging again.");
    outcome.retry_after_ms = wait_ms;
    return outcome;
  }
  last_exchange_start_ = now;

  if (!ensure_loaded_locked()) {
    return failure(CouponErrorCode::PersistenceFailure,
                   "Coupon storage is unavailable. No coupon was issued and no points were spent.");
  }

  CouponStore next = snapshot();
  if (next.available_count_at(now) >= options_.max_live_coupons) {
    return failure(CouponErrorCode::CapacityExceeded,
                   "You already hold " + std::to_string(options_.max_live_coupons) +
                       " coupons. Use some before exchanging more.");
  }

  const auto &info = kind_info(kind);
  auto id = make_identifier("coupon", now, COUPON_ID_RANDOM_CHARS, id_fill_);
  auto code = id.ok() ? unique_code(next) : common::Result<std::string>::failure(id.error());
  if (!code.ok()) {
    observability::record_error("manager", code.error());
    return failure(CouponErrorCode::EntropyUnavailable,
                   "Secure random source unavailable. No coupon was issued and no points were "
                   "spent.");
  }

  Coupon coupon;
  coupon.id = std::move(id.value());
  coupon.kind = kind;
  coupon.name = info.name;
  coupon.description = info.description;
  coupon.secret_code = std::move(code.value());
  coupon.created_at = now;
  coupon.expires_at = now + options_.expiry_days * common::kMillisPerDay;

  auto entry = history_.make_entry(HistoryAction::Exchange, coupon, options_.cost_per_coupon, now);
  if (!entry.ok()) {
    observability::record_error("manager", entry.error());
    return failure(CouponErrorCode::EntropyUnavailable,
                   "Secure random source unavailable. No coupon was issued and no points were "
                   "spent.");
  }

  bool spent = false;
  try {
    spent = ledger_.spend_points(options_.cost_per_coupon, EXCHANGE_REASON);
  } catch (const std::exception &e) {
    observability::record_error("manager", std::string("spend_points threw: ") + e.what());
    spent = false;
  }
  if (!spent) {
    return failure(CouponErrorCode::InsufficientBalance,
                   "Points could not be deducted. No coupon was issued.");
  }
  charged = true;

  next.coupons.insert(next.coupons.begin(), coupon);
  next.trim_coupons(options_.max_stored_coupons);
  history_.record(next.history, std::move(entry.value()));
  ++next.total_exchanged;

  const auto saved = persist(next);
  if (!saved.ok()) {
    observability::record_error("manager", "exchange not persisted: " + saved.error());
    return refund_after_failure(saved.error());
  }

  publish(std::move(next));
  charged = false;
  observability::record_coupon_exchanged(coupon.id, info.wire_name, options_.cost_per_coupon);

  CouponOutcome outcome;
  outcome.success = true;
  outcome.message =
      "Exchanged " + format_points(options_.cost_per_coupon) + " points for " + coupon.name + ".";
  outcome.coupon = std::move(coupon);
  return outcome;
}

CouponOutcome CouponManager::refund_after_failure(const std::string &reason) {
  bool refunded = false;
  try {
    refunded = ledger_.add_points(options_.cost_per_coupon, REFUND_REASON);
  } catch (const std::exception &e) {
    observability::record_error("manager", std::string("add_points threw: ") + e.what());
  }

  const auto points = format_points(options_.cost_per_coupon);
  CouponOutcome outcome;
  outcome.code = CouponErrorCode::PersistenceFailure;
  if (refunded) {
    outcome.refunded = true;
    outcome.message = "Could not save your coupon. " + points + " points were refunded.";
  } else {
    outcome.charged = true;
    outcome.message = "Could not save your coupon and the refund failed. You were charged " +
                      points + " points; please contact support.";
    observability::record_error("manager", "refund failed after: " + reason);
  }
  return outcome;
}

common::Result<std::string> CouponManager::unique_code(const CouponStore &store) {
  std::unordered_set<std::string> known;
  for (const auto &coupon : store.coupons) {
    known.insert(normalize_code(coupon.secret_code));
  }
  for (std::size_t attempt = 0; attempt < CODE_COLLISION_RETRIES; ++attempt) {
    auto code = codes_.generate();
    if (!code.ok()) {
      return code;
    }
    if (known.count(normalize_code(code.value())) == 0) {
      return code;
    }
  }
  return common::Result<std::string>::failure("Entropy unavailable: code space exhausted after " +
                                              std::to_string(CODE_COLLISION_RETRIES) +
                                              " collisions");
}

CouponOutcome CouponManager::use_directly(const std::string &coupon_id) {
  ScopedLatency latency("use");
  OperationLock::Guard lock(operation_lock_);
  if (!lock.owns()) {
    return busy();
  }
  try {
    return use_locked(coupon_id);
  } catch (const std::exception &e) {
    observability::record_error("manager", std::string("use failed: ") + e.what());
    return failure(CouponErrorCode::PersistenceFailure,
                   "Something went wrong. The coupon was not changed.");
  }
}

CouponOutcome CouponManager::use_locked(const std::string &coupon_id) {
  if (!ensure_loaded_locked()) {
    return failure(CouponErrorCode::PersistenceFailure,
                   "Coupon storage is unavailable. The coupon was not changed.");
  }
  const auto now = clock_.now_ms();

  CouponStore next = snapshot();
  Coupon *coupon = next.find(coupon_id);
  if (coupon == nullptr) {
    return failure(CouponErrorCode::NotFound, "Coupon not found.");
  }
  switch (coupon->state_at(now)) {
  case CouponState::Used:
    return failure(CouponErrorCode::AlreadyUsed, "This coupon has already been used.");
  case CouponState::Expired:
    return failure(CouponErrorCode::Expired, "This coupon has expired.");
  case CouponState::Available:
    break;
  }

  auto entry = history_.make_entry(HistoryAction::Use, *coupon, std::nullopt, now);
  if (!entry.ok()) {
    return failure(CouponErrorCode::EntropyUnavailable,
                   "Secure random source unavailable. The coupon was not changed.");
  }
  coupon->is_used = true;
  coupon->used_at = now;
  Coupon used = *coupon;
  history_.record(next.history, std::move(entry.value()));
  ++next.total_used;

  const auto saved = persist(next);
  if (!saved.ok()) {
    observability::record_error("manager", "use not persisted: " + saved.error());
    return failure(CouponErrorCode::PersistenceFailure,
                   "Could not save the change. The coupon is still available.");
  }
  publish(std::move(next));
  observability::record_coupon_used(used.id, "direct");

  CouponOutcome outcome;
  outcome.success = true;
  outcome.message = used.name + " has been used.";
  outcome.coupon = std::move(used);
  return outcome;
}

CouponOutcome CouponManager::verify_by_code(const std::string &raw_code) {
  ScopedLatency latency("verify");
  OperationLock::Guard lock(operation_lock_);
  if (!lock.owns()) {
    return busy();
  }
  try {
    return verify_locked(raw_code);
  } catch (const std::exception &e) {
    observability::record_error("manager", std::string("verify failed: ") + e.what());
    return failure(CouponErrorCode::PersistenceFailure,
                   "Something went wrong. The coupon was not changed.");
  }
}

CouponOutcome CouponManager::verify_locked(const std::string &raw_code) {
  if (!ensure_loaded_locked()) {
    return failure(CouponErrorCode::PersistenceFailure,
                   "Coupon storage is unavailable. The coupon was not changed.");
  }
  const auto now = clock_.now_ms();

  const auto gate = guard_.check(now);
  if (gate.locked) {
    return locked_out(gate.retry_after_ms);
  }

  const auto code = normalize_code(raw_code);
  if (code.size() < options_.min_code_length) {
    return failure(CouponErrorCode::InvalidInput,
                   "Enter the full " + std::to_string(SECRET_CODE_LENGTH) + "-character code.");
  }

  CouponStore next = snapshot();
  // Every stored code is compared so the scan takes the same time wherever a match sits.
  std::optional<std::size_t> match;
  for (std::size_t i = 0; i < next.coupons.size(); ++i) {
    const bool equal =
        security::constant_time_equals(normalize_code(next.coupons[i].secret_code), code);
    if (equal && !match.has_value()) {
      match = i;
    }
  }

  if (!match.has_value()) {
    const auto failed = guard_.record_failure(now);
    if (failed.locked) {
      return locked_out(failed.locked_until - now);
    }
    auto outcome = failure(CouponErrorCode::NotFound,
                           "Invalid code. " + plural(failed.remaining_attempts, "attempt") +
                               " remaining.");
    outcome.remaining_attempts = failed.remaining_attempts;
    return outcome;
  }

  Coupon &coupon = next.coupons[*match];
  switch (coupon.state_at(now)) {
  case CouponState::Used:
    return failure(CouponErrorCode::AlreadyUsed, "This coupon has already been used.");
  case CouponState::Expired:
    return failure(CouponErrorCode::Expired, "This coupon has expired.");
  case CouponState::Available:
    break;
  }

  const auto reset = guard_.record_success();
  if (!reset.ok()) {
    observability::record_error("manager", "attempt reset not persisted: " + reset.error());
  }

  auto entry = history_.make_entry(HistoryAction::Use, coupon, std::nullopt, now);
  if (!entry.ok()) {
    return failure(CouponErrorCode::EntropyUnavailable,
                   "Secure random source unavailable. The coupon was not changed.");
  }
  coupon.is_used = true;
  coupon.used_at = now;
  coupon.verified_at = now;
  Coupon verified = coupon;
  history_.record(next.history, std::move(entry.value()));
  ++next.total_used;

  const auto saved = persist(next);
  if (!saved.ok()) {
    observability::record_error("manager", "verification not persisted: " + saved.error());
    return failure(CouponErrorCode::PersistenceFailure,
                   "Could not save the verification. Please try again.");
  }
  publish(std::move(next));
  observability::record_coupon_used(verified.id, "code");

  CouponOutcome outcome;
  outcome.success = true;
  outcome.message = "Verified: " + verified.name + ".";
  outcome.coupon = std::move(verified);
  return outcome;
}

common::Status CouponManager::flush() {
  OperationLock::Guard lock(operation_lock_);
  if (!lock.owns()) {
    return common::Status::error("busy");
  }
  {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    if (!loaded_) {
      return common::Status::success();
    }
  }
  return persist(snapshot());
}

std::vector<Coupon> CouponManager::coupons() const { return snapshot().coupons; }

std::vector<Coupon> CouponManager::available_coupons() const {
  std::lock_guard<std::mutex> state_lock(state_mutex_);
  return state_.available_at(clock_.now_ms());
}

std::vector<HistoryEntry> CouponManager::history() const {
  std::lock_guard<std::mutex> state_lock(state_mutex_);
  return state_.history;
}

std::uint64_t CouponManager::total_exchanged() const {
  std::lock_guard<std::mutex> state_lock(state_mutex_);
  return state_.total_exchanged;
}

std::uint64_t CouponManager::total_used() const {
  std::lock_guard<std::mutex> state_lock(state_mutex_);
  return state_.total_used;
}

bool CouponManager::can_exchange(const std::int64_t point_balance) const {
  if (point_balance < options_.cost_per_coupon) {
    return false;
  }
  std::lock_guard<std::mutex> state_lock(state_mutex_);
  return state_.available_count_at(clock_.now_ms()) < options_.max_live_coupons;
}

std::int64_t CouponManager::points_needed_for_coupon(const std::int64_t point_balance) const {
  return std::max<std::int64_t>(0, options_.cost_per_coupon - point_balance);
}

LockoutStatus CouponManager::lockout_status() const { return guard_.status(clock_.now_ms()); }

} // namespace couponvault::coupons

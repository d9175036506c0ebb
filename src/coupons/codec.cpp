#include "couponvault/coupons/codec.hpp"

#include "couponvault/common/fs.hpp"
#include "couponvault/common/json_util.hpp"

#include <sstream>

namespace couponvault::coupons {

namespace {

constexpr int BACKUP_VERSION = 1;

std::string quoted(const std::string &value) { return "\"" + common::json_escape(value) + "\""; }

bool looks_like_object(const std::string &json) {
  const std::string trimmed = common::trim(json);
  return trimmed.size() >= 2 && trimmed.front() == '{' && trimmed.back() == '}';
}

// Fields shared by the full and the backup coupon shapes.
std::optional<Coupon> decode_coupon_core(const std::string &object, const char *code_field) {
  const auto id = common::json_get_string(object, "id");
  const auto type = common::json_get_string(object, "type");
  const auto created_at = common::json_get_int(object, "createdAt");
  const auto expires_at = common::json_get_int(object, "expiresAt");
  if (!id.has_value() || common::trim(*id).empty() || !type.has_value() ||
      !created_at.has_value() || !expires_at.has_value()) {
    return std::nullopt;
  }
  const auto kind = parse_kind(*type);
  if (!kind.has_value()) {
    return std::nullopt;
  }

  Coupon coupon;
  coupon.id = *id;
  coupon.kind = *kind;
  coupon.created_at = *created_at;
  coupon.expires_at = *expires_at;
  coupon.is_used = common::json_get_bool(object, "isUsed").value_or(false);
  coupon.secret_code = common::json_get_string(object, code_field).value_or("");
  coupon.name = common::json_get_string(object, "name").value_or("");
  return coupon;
}

std::optional<HistoryEntry> decode_history_entry(const std::string &object) {
  const auto id = common::json_get_string(object, "id");
  const auto action = common::json_get_string(object, "action");
  const auto coupon_id = common::json_get_string(object, "couponId");
  const auto timestamp = common::json_get_int(object, "timestamp");
  if (!id.has_value() || !action.has_value() || !coupon_id.has_value() ||
      !timestamp.has_value()) {
    return std::nullopt;
  }
  const auto parsed_action = parse_history_action(*action);
  if (!parsed_action.has_value()) {
    return std::nullopt;
  }

  HistoryEntry entry;
  entry.id = *id;
  entry.action = *parsed_action;
  entry.coupon_id = *coupon_id;
  entry.coupon_name = common::json_get_string(object, "couponName").value_or("");
  entry.points_spent = common::json_get_int(object, "pointsSpent");
  entry.timestamp = *timestamp;
  return entry;
}

std::uint64_t non_negative(const std::optional<std::int64_t> value) {
  return value.has_value() && *value > 0 ? static_cast<std::uint64_t>(*value) : 0;
}

} // namespace

std::string encode_coupon(const Coupon &coupon) {
  std::ostringstream json;
  json << "{";
  json << "\"id\":" << quoted(coupon.id) << ",";
  json << "\"type\":" << quoted(kind_info(coupon.kind).wire_name) << ",";
  json << "\"name\":" << quoted(coupon.name) << ",";
  json << "\"description\":" << quoted(coupon.description) << ",";
  json << "\"secretCode\":" << quoted(coupon.secret_code) << ",";
  json << "\"createdAt\":" << coupon.created_at << ",";
  json << "\"expiresAt\":" << coupon.expires_at << ",";
  if (coupon.used_at.has_value()) {
    json << "\"usedAt\":" << *coupon.used_at << ",";
  }
  if (coupon.verified_at.has_value()) {
    json << "\"verifiedAt\":" << *coupon.verified_at << ",";
  }
  json << "\"isUsed\":" << (coupon.is_used ? "true" : "false");
  json << "}";
  return json.str();
}

std::string encode_history_entry(const HistoryEntry &entry) {
  std::ostringstream json;
  json << "{";
  json << "\"id\":" << quoted(entry.id) << ",";
  json << "\"action\":" << quoted(to_string(entry.action)) << ",";
  json << "\"couponId\":" << quoted(entry.coupon_id) << ",";
  json << "\"couponName\":" << quoted(entry.coupon_name) << ",";
  if (entry.points_spent.has_value()) {
    json << "\"pointsSpent\":" << *entry.points_spent << ",";
  }
  json << "\"timestamp\":" << entry.timestamp;
  json << "}";
  return json.str();
}

std::string encode_store(const CouponStore &store) {
  std::ostringstream json;
  json << "{\"coupons\":[";
  for (std::size_t i = 0; i < store.coupons.size(); ++i) {
    if (i > 0) {
      json << ",";
    }
    json << encode_coupon(store.coupons[i]);
  }
  json << "],\"history\":[";
  for (std::size_t i = 0; i < store.history.size(); ++i) {
    if (i > 0) {
      json << ",";
    }
    json << encode_history_entry(store.history[i]);
  }
  json << "],\"totalExchanged\":" << store.total_exchanged;
  json << ",\"totalUsed\":" << store.total_used << "}";
  return json.str();
}

common::Result<DecodedStore> decode_store(const std::string &json, const DecodeLimits &limits) {
  if (!looks_like_object(json)) {
    return common::Result<DecodedStore>::failure("store is not a JSON object");
  }

  const std::string coupons_json = common::json_get_array(json, "coupons");
  const std::string history_json = common::json_get_array(json, "history");
  if (coupons_json.empty() || history_json.empty()) {
    return common::Result<DecodedStore>::failure("store is missing coupons or history");
  }

  const auto coupon_objects = common::json_split_top_level_objects(coupons_json);
  const auto history_objects = common::json_split_top_level_objects(history_json);
  if (coupon_objects.size() > limits.max_coupons) {
    return common::Result<DecodedStore>::failure(
        "coupon list has " + std::to_string(coupon_objects.size()) + " entries, limit " +
        std::to_string(limits.max_coupons));
  }
  if (history_objects.size() > limits.max_history) {
    return common::Result<DecodedStore>::failure(
        "history has " + std::to_string(history_objects.size()) + " entries, limit " +
        std::to_string(limits.max_history));
  }

  DecodedStore decoded;
  for (const auto &object : coupon_objects) {
    auto coupon = decode_coupon_core(object, "secretCode");
    if (!coupon.has_value()) {
      ++decoded.dropped_coupons;
      continue;
    }
    coupon->description = common::json_get_string(object, "description").value_or("");
    coupon->used_at = common::json_get_int(object, "usedAt");
    coupon->verified_at = common::json_get_int(object, "verifiedAt");
    if (coupon->name.empty() || coupon->description.empty()) {
      const auto &info = kind_info(coupon->kind);
      if (coupon->name.empty()) {
        coupon->name = info.name;
      }
      if (coupon->description.empty()) {
        coupon->description = info.description;
      }
      ++decoded.migrated_coupons;
    }
    decoded.store.coupons.push_back(std::move(*coupon));
  }

  for (const auto &object : history_objects) {
    auto entry = decode_history_entry(object);
    if (!entry.has_value()) {
      ++decoded.dropped_history;
      continue;
    }
    decoded.store.history.push_back(std::move(*entry));
  }

  decoded.store.total_exchanged = non_negative(common::json_get_int(json, "totalExchanged"));
  decoded.store.total_used = non_negative(common::json_get_int(json, "totalUsed"));
  return common::Result<DecodedStore>::success(std::move(decoded));
}

std::string encode_backup(const BackupRecord &record) {
  std::ostringstream json;
  json << "{\"version\":" << BACKUP_VERSION << ",";
  json << "\"savedAt\":" << record.saved_at << ",";
  json << "\"totalExchanged\":" << record.total_exchanged << ",";
  json << "\"totalUsed\":" << record.total_used << ",";
  if (record.kind == BackupKind::Metadata) {
    json << "\"kind\":\"meta\",";
    json << "\"couponCount\":" << record.coupon_count << ",";
    json << "\"availableCount\":" << record.available_count << "}";
    return json.str();
  }

  json << "\"kind\":\"coupons\",\"coupons\":[";
  for (std::size_t i = 0; i < record.coupons.size(); ++i) {
    const auto &coupon = record.coupons[i];
    if (i > 0) {
      json << ",";
    }
    json << "{\"id\":" << quoted(coupon.id) << ",";
    json << "\"code\":" << quoted(coupon.secret_code) << ",";
    json << "\"type\":" << quoted(kind_info(coupon.kind).wire_name) << ",";
    json << "\"name\":" << quoted(coupon.name) << ",";
    json << "\"createdAt\":" << coupon.created_at << ",";
    json << "\"expiresAt\":" << coupon.expires_at << ",";
    json << "\"isUsed\":" << (coupon.is_used ? "true" : "false") << "}";
  }
  json << "]}";
  return json.str();
}

common::Result<BackupRecord> decode_backup(const std::string &json) {
  if (!looks_like_object(json)) {
    return common::Result<BackupRecord>::failure("backup is not a JSON object");
  }
  if (common::json_get_int(json, "version") != BACKUP_VERSION) {
    return common::Result<BackupRecord>::failure("unsupported backup version");
  }

  BackupRecord record;
  record.saved_at = common::json_get_int(json, "savedAt").value_or(0);
  record.total_exchanged = non_negative(common::json_get_int(json, "totalExchanged"));
  record.total_used = non_negative(common::json_get_int(json, "totalUsed"));

  const auto kind = common::json_get_string(json, "kind");
  if (kind == "meta") {
    record.kind = BackupKind::Metadata;
    record.coupon_count = non_negative(common::json_get_int(json, "couponCount"));
    record.available_count = non_negative(common::json_get_int(json, "availableCount"));
    return common::Result<BackupRecord>::success(std::move(record));
  }
  if (kind != "coupons") {
    return common::Result<BackupRecord>::failure("unknown backup kind");
  }

  const std::string coupons_json = common::json_get_array(json, "coupons");
  if (coupons_json.empty()) {
    return common::Result<BackupRecord>::failure("backup is missing coupons");
  }
  record.kind = BackupKind::Coupons;
  for (const auto &object : common::json_split_top_level_objects(coupons_json)) {
    auto coupon = decode_coupon_core(object, "code");
    if (!coupon.has_value()) {
      continue;
    }
    const auto &info = kind_info(coupon->kind);
    if (coupon->name.empty()) {
      coupon->name = info.name;
    }
    coupon->description = info.description;
    record.coupons.push_back(std::move(*coupon));
  }
  record.coupon_count = record.coupons.size();
  return common::Result<BackupRecord>::success(std::move(record));
}

std::string encode_lockout(const LockoutState &state) {
  std::ostringstream json;
  json << "{\"attempts\":" << state.failed_attempts << ",\"lockoutUntil\":" << state.locked_until
       << "}";
  return json.str();
}

common::Result<LockoutState> decode_lockout(const std::string &json) {
  if (!looks_like_object(json)) {
    return common::Result<LockoutState>::failure("lockout record is not a JSON object");
  }
  const auto attempts = common::json_get_int(json, "attempts");
  const auto until = common::json_get_int(json, "lockoutUntil");
  if (!attempts.has_value() || !until.has_value() || *attempts < 0 || *until < 0) {
    return common::Result<LockoutState>::failure("lockout record is malformed");
  }
  LockoutState state;
  state.failed_attempts = static_cast<std::uint32_t>(*attempts);
  state.locked_until = *until;
  return common::Result<LockoutState>::success(state);
}

} // namespace couponvault::coupons

#include "couponvault/config/config.hpp"

#include "couponvault/common/fs.hpp"
#include "couponvault/common/toml.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <sstream>

namespace couponvault::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".couponvault";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("COUPONVAULT_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

template <typename T> T clamp_to(const std::int64_t value, const T fallback) {
  if (value < 0 || static_cast<std::uint64_t>(value) > std::numeric_limits<T>::max()) {
    return fallback;
  }
  return static_cast<T>(value);
}

std::optional<std::int64_t> env_int(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  const std::string text = common::trim(raw);
  std::int64_t parsed = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return parsed;
}

bool backend_is_known(const std::string &backend) {
  std::stringstream stream(common::to_lower(backend));
  std::string part;
  bool any = false;
  while (std::getline(stream, part, ',')) {
    const std::string p = common::trim(part);
    if (p != "log" && p != "none" && p != "noop") {
      return false;
    }
    any = true;
  }
  return any || backend.empty();
}

void load_coupon_config(Config &config, const common::TomlDocument &doc) {
  auto &coupons = config.coupons;
  coupons.cost_per_coupon = doc.get_i64("coupons.cost_per_coupon", coupons.cost_per_coupon);
  coupons.max_live_coupons = clamp_to<std::uint32_t>(
      doc.get_i64("coupons.max_live_coupons", coupons.max_live_coupons), coupons.max_live_coupons);
  coupons.max_stored_coupons =
      clamp_to<std::uint32_t>(doc.get_i64("coupons.max_stored_coupons", coupons.max_stored_coupons),
                              coupons.max_stored_coupons);
  coupons.max_history = clamp_to<std::uint32_t>(
      doc.get_i64("coupons.max_history", coupons.max_history), coupons.max_history);
  coupons.expiry_days = clamp_to<std::uint32_t>(
      doc.get_i64("coupons.expiry_days", coupons.expiry_days), coupons.expiry_days);
  coupons.exchange_cooldown_ms =
      doc.get_i64("coupons.exchange_cooldown_ms", coupons.exchange_cooldown_ms);
}

void load_verification_config(Config &config, const common::TomlDocument &doc) {
  auto &verification = config.verification;
  verification.max_attempts = clamp_to<std::uint32_t>(
      doc.get_i64("verification.max_attempts", verification.max_attempts),
      verification.max_attempts);
  verification.lockout_seconds =
      doc.get_i64("verification.lockout_seconds", verification.lockout_seconds);
  verification.min_code_length = clamp_to<std::uint32_t>(
      doc.get_i64("verification.min_code_length", verification.min_code_length),
      verification.min_code_length);
}

void load_storage_config(Config &config, const common::TomlDocument &doc) {
  auto &storage = config.storage;
  if (doc.has("storage.data_dir")) {
    storage.data_dir = expand_config_value(doc.get_string("storage.data_dir"));
  }
  storage.database_file = doc.get_string("storage.database_file", storage.database_file);
  storage.backup_dir = doc.get_string("storage.backup_dir", storage.backup_dir);
  storage.backup_max_bytes = clamp_to<std::size_t>(
      doc.get_i64("storage.backup_max_bytes", static_cast<std::int64_t>(storage.backup_max_bytes)),
      storage.backup_max_bytes);
  storage.backup_max_coupons = clamp_to<std::uint32_t>(
      doc.get_i64("storage.backup_max_coupons", storage.backup_max_coupons),
      storage.backup_max_coupons);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override.reset(); }

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

common::Result<std::filesystem::path> data_dir(const Config &config) {
  if (!common::trim(config.storage.data_dir).empty()) {
    return common::ensure_dir(common::expand_path(config.storage.data_dir));
  }
  return config_dir();
}

void apply_env_overrides(Config &config) {
  if (const char *dir = std::getenv("COUPONVAULT_DATA_DIR"); dir != nullptr && *dir != '\0') {
    config.storage.data_dir = common::expand_path(dir);
  }

  if (const char *backend = std::getenv("COUPONVAULT_OBSERVABILITY");
      backend != nullptr && *backend != '\0') {
    config.observability.backend = backend;
  }

  if (const auto cost = env_int("COUPONVAULT_COST_PER_COUPON"); cost.has_value()) {
    config.coupons.cost_per_coupon = *cost;
  }
}

common::Result<Config> load_config() {
  Config config;

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  const auto parsed = common::parse_toml(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }

  const auto &doc = parsed.value();
  load_coupon_config(config, doc);
  load_verification_config(config, doc);
  load_storage_config(config, doc);
  if (doc.has("observability.backend")) {
    config.observability.backend = doc.get_string("observability.backend");
  }

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  std::ostringstream file;
  file << "[coupons]\n";
  file << "cost_per_coupon = " << config.coupons.cost_per_coupon << "\n";
  file << "max_live_coupons = " << config.coupons.max_live_coupons << "\n";
  file << "max_stored_coupons = " << config.coupons.max_stored_coupons << "\n";
  file << "max_history = " << config.coupons.max_history << "\n";
  file << "expiry_days = " << config.coupons.expiry_days << "\n";
  file << "exchange_cooldown_ms = " << config.coupons.exchange_cooldown_ms << "\n";

  file << "\n[verification]\n";
  file << "max_attempts = " << config.verification.max_attempts << "\n";
  file << "lockout_seconds = " << config.verification.lockout_seconds << "\n";
  file << "min_code_length = " << config.verification.min_code_length << "\n";

  file << "\n[storage]\n";
  if (!config.storage.data_dir.empty()) {
    file << "data_dir = " << common::quote_toml_string(config.storage.data_dir) << "\n";
  }
  file << "database_file = " << common::quote_toml_string(config.storage.database_file) << "\n";
  file << "backup_dir = " << common::quote_toml_string(config.storage.backup_dir) << "\n";
  file << "backup_max_bytes = " << config.storage.backup_max_bytes << "\n";
  file << "backup_max_coupons = " << config.storage.backup_max_coupons << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  return common::write_file_atomic(cfg_path_result.value(), file.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.coupons.cost_per_coupon <= 0) {
    return Warnings::failure("coupons.cost_per_coupon must be positive");
  }
  if (config.coupons.max_live_coupons == 0) {
    return Warnings::failure("coupons.max_live_coupons must be positive");
  }
  if (config.coupons.max_stored_coupons < config.coupons.max_live_coupons) {
    return Warnings::failure("coupons.max_stored_coupons must be >= coupons.max_live_coupons");
  }
  if (config.coupons.max_history == 0) {
    return Warnings::failure("coupons.max_history must be positive");
  }
  if (config.coupons.expiry_days == 0) {
    return Warnings::failure("coupons.expiry_days must be positive");
  }
  if (config.coupons.exchange_cooldown_ms < 0) {
    return Warnings::failure("coupons.exchange_cooldown_ms must not be negative");
  }

  if (config.verification.max_attempts == 0) {
    return Warnings::failure("verification.max_attempts must be positive");
  }
  if (config.verification.lockout_seconds <= 0) {
    return Warnings::failure("verification.lockout_seconds must be positive");
  }
  if (config.verification.lockout_seconds < 60) {
    warnings.push_back("verification.lockout_seconds below 60 weakens brute-force protection");
  }
  if (config.verification.min_code_length == 0) {
    return Warnings::failure("verification.min_code_length must be positive");
  }

  if (config.storage.backup_max_bytes < 256) {
    return Warnings::failure("storage.backup_max_bytes must be at least 256");
  }
  if (common::trim(config.storage.database_file).empty()) {
    return Warnings::failure("storage.database_file must not be empty");
  }

  if (!backend_is_known(config.observability.backend)) {
    return Warnings::failure("Invalid observability.backend: " + config.observability.backend);
  }

  return Warnings::success(std::move(warnings));
}

} // namespace couponvault::config

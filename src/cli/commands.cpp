#include "couponvault/cli/commands.hpp"

#include "couponvault/cli/demo_ledger.hpp"
#include "couponvault/common/clock.hpp"
#include "couponvault/common/fs.hpp"
#include "couponvault/config/config.hpp"
#include "couponvault/coupons/manager.hpp"
#include "couponvault/runtime/app.hpp"
#include "couponvault/security/secrets.hpp"

#include <algorithm>
#include <charconv>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace couponvault::cli {

namespace {

std::string version_string() {
#ifdef COUPONVAULT_VERSION
  std::string version = COUPONVAULT_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "couponvault " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::optional<std::int64_t> parse_int(const std::string &text) {
  std::int64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

const char *state_label(const coupons::CouponState state) {
  switch (state) {
  case coupons::CouponState::Available:
    return "available";
  case coupons::CouponState::Expired:
    return "expired";
  case coupons::CouponState::Used:
    return "used";
  }
  return "unknown";
}

std::shared_ptr<runtime::CouponService> open_service() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return nullptr;
  }
  auto service = context.value().create_coupon_service(make_demo_ledger);
  if (!service.ok()) {
    std::cerr << service.error() << "\n";
    return nullptr;
  }
  return service.value();
}

int print_outcome(const coupons::CouponOutcome &outcome) {
  if (outcome.success) {
    std::cout << outcome.message << "\n";
    return 0;
  }
  std::cerr << "[" << coupons::to_string(outcome.code) << "] " << outcome.message << "\n";
  return 1;
}

void print_coupon(const coupons::Coupon &coupon, const common::TimestampMs now,
                  const bool reveal) {
  const std::string code =
      reveal ? coupon.secret_code : security::mask_secret(coupon.secret_code, 4);
  std::cout << coupon.id << "  " << std::left << std::setw(20) << coupon.name << std::setw(16)
            << code << std::right << state_label(coupon.state_at(now)) << "  expires "
            << common::format_timestamp(coupon.expires_at) << "\n";
}

int run_status() {
  auto service = open_service();
  if (service == nullptr) {
    return 1;
  }
  auto &manager = service->manager();
  DemoLedger ledger(service->primary_store());
  const auto balance = ledger.balance();
  const auto lockout = manager.lockout_status();

  if (balance.ok()) {
    std::cout << "Points: " << coupons::format_points(balance.value()) << "\n";
    std::cout << "Points needed for next coupon: "
              << coupons::format_points(manager.points_needed_for_coupon(balance.value()))
              << "\n";
  }
  std::cout << "Available coupons: " << manager.available_coupons().size() << "\n";
  std::cout << "Total exchanged: " << manager.total_exchanged() << "\n";
  std::cout << "Total used: " << manager.total_used() << "\n";
  if (lockout.locked) {
    std::cout << "Verification: locked until " << common::format_timestamp(lockout.locked_until)
              << "\n";
  } else {
    std::cout << "Verification: " << lockout.remaining_attempts << " attempts remaining\n";
  }
  if (auto cp = config::config_path(); cp.ok()) {
    std::cout << "Config: " << cp.value().string() << "\n";
  }
  std::cout << "Database: " << service->primary_store().path().string() << "\n";
  return 0;
}

int run_exchange(std::vector<std::string> args) {
  coupons::CouponKind kind = coupons::CouponKind::FreeEvent;
  std::string value;
  if (take_option(args, "--kind", value)) {
    const auto parsed = coupons::parse_kind(value);
    if (!parsed.has_value()) {
      std::cerr << "unknown coupon kind: " << value << " (free_event, discount, special)\n";
      return 1;
    }
    kind = *parsed;
  }
  std::optional<std::int64_t> balance_override;
  if (take_option(args, "--balance", value)) {
    balance_override = parse_int(value);
    if (!balance_override.has_value() || *balance_override < 0) {
      std::cerr << "invalid --balance: " << value << "\n";
      return 1;
    }
  }

  auto service = open_service();
  if (service == nullptr) {
    return 1;
  }
  DemoLedger ledger(service->primary_store());
  if (balance_override.has_value()) {
    const auto set = ledger.set_balance(*balance_override);
    if (!set.ok()) {
      std::cerr << set.error() << "\n";
      return 1;
    }
  }
  const auto balance = ledger.balance();
  if (!balance.ok()) {
    std::cerr << balance.error() << "\n";
    return 1;
  }

  const auto outcome = service->manager().exchange(balance.value(), kind);
  const int rc = print_outcome(outcome);
  if (outcome.success && outcome.coupon.has_value()) {
    std::cout << "Coupon: " << outcome.coupon->id << "\n";
    std::cout << "Code:   " << outcome.coupon->secret_code << "\n";
    std::cout << "Valid until " << common::format_timestamp(outcome.coupon->expires_at) << "\n";
  }
  return rc;
}

int run_use(const std::vector<std::string> &args) {
  if (args.empty()) {
    std::cerr << "usage: couponvault use <coupon-id>\n";
    return 1;
  }
  auto service = open_service();
  if (service == nullptr) {
    return 1;
  }
  return print_outcome(service->manager().use_directly(args[0]));
}

int run_verify(const std::vector<std::string> &args) {
  if (args.empty()) {
    std::cerr << "usage: couponvault verify <code>\n";
    return 1;
  }
  std::string code;
  for (const auto &part : args) {
    code += part;
  }
  auto service = open_service();
  if (service == nullptr) {
    return 1;
  }
  return print_outcome(service->manager().verify_by_code(code));
}

int run_history(std::vector<std::string> args) {
  std::size_t limit = 20;
  std::string value;
  if (take_option(args, "--limit", value)) {
    const auto parsed = parse_int(value);
    if (!parsed.has_value() || *parsed <= 0) {
      std::cerr << "invalid --limit: " << value << "\n";
      return 1;
    }
    limit = static_cast<std::size_t>(*parsed);
  }
  auto service = open_service();
  if (service == nullptr) {
    return 1;
  }
  const auto history = service->manager().history();
  if (history.empty()) {
    std::cout << "No history yet.\n";
    return 0;
  }
  for (std::size_t i = 0; i < history.size() && i < limit; ++i) {
    const auto &entry = history[i];
    std::cout << common::format_timestamp(entry.timestamp) << "  " << std::left << std::setw(8)
              << coupons::to_string(entry.action) << std::right << "  " << entry.coupon_name;
    if (entry.points_spent.has_value()) {
      std::cout << "  -" << coupons::format_points(*entry.points_spent) << " points";
    }
    std::cout << "\n";
  }
  return 0;
}

int run_list(const std::vector<std::string> &args) {
  const bool reveal = std::find(args.begin(), args.end(), "--reveal") != args.end();
  auto service = open_service();
  if (service == nullptr) {
    return 1;
  }
  const auto coupons = service->manager().coupons();
  if (coupons.empty()) {
    std::cout << "No coupons.\n";
    return 0;
  }
  const auto now = common::system_clock().now_ms();
  for (const auto &coupon : coupons) {
    print_coupon(coupon, now, reveal);
  }
  return 0;
}

int run_config(std::vector<std::string> args) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto &c = cfg.value();

  if (args.empty() || args[0] == "show") {
    if (auto cp = config::config_path(); cp.ok()) {
      std::cout << "Config: " << cp.value().string() << "\n";
    }
    if (auto dir = config::data_dir(c); dir.ok()) {
      std::cout << "Data: " << dir.value().string() << "\n";
    }
    std::cout << "coupons.cost_per_coupon = " << c.coupons.cost_per_coupon << "\n";
    std::cout << "coupons.max_live_coupons = " << c.coupons.max_live_coupons << "\n";
    std::cout << "coupons.expiry_days = " << c.coupons.expiry_days << "\n";
    std::cout << "coupons.exchange_cooldown_ms = " << c.coupons.exchange_cooldown_ms << "\n";
    std::cout << "verification.max_attempts = " << c.verification.max_attempts << "\n";
    std::cout << "verification.lockout_seconds = " << c.verification.lockout_seconds << "\n";
    std::cout << "observability.backend = " << c.observability.backend << "\n";
    return 0;
  }

  if (args[0] == "set") {
    if (args.size() < 3) {
      std::cerr << "usage: couponvault config set <key> <value>\n";
      return 1;
    }
    const std::string &key = args[1];
    const std::string &value = args[2];
    if (key == "observability.backend") {
      c.observability.backend = value;
    } else if (key == "storage.data_dir") {
      c.storage.data_dir = value;
    } else {
      const auto number = parse_int(value);
      if (!number.has_value() || *number < 0) {
        std::cerr << "expected a non-negative integer for " << key << "\n";
        return 1;
      }
      if (key == "coupons.cost_per_coupon") {
        c.coupons.cost_per_coupon = *number;
      } else if (key == "coupons.max_live_coupons") {
        c.coupons.max_live_coupons = static_cast<std::uint32_t>(*number);
      } else if (key == "coupons.expiry_days") {
        c.coupons.expiry_days = static_cast<std::uint32_t>(*number);
      } else if (key == "coupons.exchange_cooldown_ms") {
        c.coupons.exchange_cooldown_ms = *number;
      } else if (key == "verification.max_attempts") {
        c.verification.max_attempts = static_cast<std::uint32_t>(*number);
      } else if (key == "verification.lockout_seconds") {
        c.verification.lockout_seconds = *number;
      } else {
        std::cerr << "unknown key: " << key << "\n";
        return 1;
      }
    }
    auto validated = config::validate_config(c);
    if (!validated.ok()) {
      std::cerr << validated.error() << "\n";
      return 1;
    }
    auto saved = config::save_config(c);
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    return 0;
  }

  std::cerr << "unknown config command\n";
  return 1;
}

} // namespace

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << "  couponvault" << RESET << DIM << "  points-for-coupons exchange desk" << RESET
            << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "couponvault [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  COUPONS" << RESET << "\n";
  std::cout << "  " << GREEN << "exchange" << RESET << DIM
            << "       Spend points on a coupon [--kind K] [--balance N]" << RESET << "\n";
  std::cout << "  " << GREEN << "use" << RESET << " ID" << DIM << "         Mark a coupon as used"
            << RESET << "\n";
  std::cout << "  " << GREEN << "verify" << RESET << " CODE" << DIM
            << "    Redeem a coupon by its secret code" << RESET << "\n";
  std::cout << "  " << GREEN << "list" << RESET << DIM << "           List stored coupons [--reveal]" << RESET
            << "\n";
  std::cout << "  " << GREEN << "history" << RESET << DIM << "        Show recent activity [--limit N]"
            << RESET << "\n\n";

  std::cout << BOLD << "  OTHER" << RESET << "\n";
  std::cout << "  " << GREEN << "status" << RESET << DIM << "         Balance, totals and lockout"
            << RESET << "\n";
  std::cout << "  " << GREEN << "config show" << RESET << DIM << "    Display current configuration"
            << RESET << "\n";
  std::cout << "  " << GREEN << "config set" << RESET << DIM << "     Update a configuration key"
            << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Show version" << RESET << "\n\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "status") {
    return run_status();
  }
  if (subcommand == "exchange") {
    return run_exchange(std::move(args));
  }
  if (subcommand == "use") {
    return run_use(args);
  }
  if (subcommand == "verify") {
    return run_verify(args);
  }
  if (subcommand == "history") {
    return run_history(std::move(args));
  }
  if (subcommand == "list") {
    return run_list(args);
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace couponvault::cli

#include "couponvault/coupons/code_generator.hpp"

#include "couponvault/common/fs.hpp"
#include "couponvault/security/secrets.hpp"

#include <cctype>
#include <vector>

namespace couponvault::coupons {

namespace {

constexpr int MAX_DRAW_ROUNDS = 16;

common::Result<std::string> draw_symbols(const RandomFill &fill, const std::string_view alphabet,
                                         const std::size_t count) {
  // Bytes at or above the largest multiple of the alphabet size are redrawn, so every symbol
  // is equally likely. The code alphabet divides 256 and never redraws; base36 does.
  const unsigned limit = 256 - (256 % static_cast<unsigned>(alphabet.size()));
  std::string out;
  out.reserve(count);
  std::vector<unsigned char> buffer(count * 2);

  for (int round = 0; round < MAX_DRAW_ROUNDS && out.size() < count; ++round) {
    if (const auto status = fill(buffer.data(), buffer.size()); !status.ok()) {
      return common::Result<std::string>::failure("Entropy unavailable: " + status.error());
    }
    for (const unsigned char byte : buffer) {
      if (out.size() == count) {
        break;
      }
      if (byte < limit) {
        out.push_back(alphabet[byte % alphabet.size()]);
      }
    }
  }

  if (out.size() < count) {
    return common::Result<std::string>::failure("Entropy unavailable: random source is degenerate");
  }
  return common::Result<std::string>::success(std::move(out));
}

} // namespace

SecretCodeGenerator::SecretCodeGenerator() : fill_(security::secure_random_bytes) {}

SecretCodeGenerator::SecretCodeGenerator(RandomFill fill) : fill_(std::move(fill)) {}

common::Result<std::string> SecretCodeGenerator::generate() {
  if (!fill_) {
    return common::Result<std::string>::failure("Entropy unavailable: no random source");
  }
  auto symbols = draw_symbols(fill_, SECRET_CODE_ALPHABET, SECRET_CODE_LENGTH);
  if (!symbols.ok()) {
    return symbols;
  }
  return common::Result<std::string>::success(format_code(symbols.value()));
}

std::string normalize_code(const std::string &raw) {
  const std::string upper = common::to_upper(common::trim(raw));
  std::string out;
  out.reserve(upper.size());
  for (const char ch : upper) {
    if (ch == SECRET_CODE_DELIMITER || std::isspace(static_cast<unsigned char>(ch)) != 0) {
      continue;
    }
    out.push_back(ch);
  }
  return out;
}

std::string format_code(const std::string &normalized) {
  std::string out;
  out.reserve(normalized.size() + normalized.size() / SECRET_CODE_GROUP);
  for (std::size_t i = 0; i < normalized.size(); ++i) {
    if (i > 0 && i % SECRET_CODE_GROUP == 0) {
      out.push_back(SECRET_CODE_DELIMITER);
    }
    out.push_back(normalized[i]);
  }
  return out;
}

bool is_well_formed_code(const std::string &normalized) {
  if (normalized.size() != SECRET_CODE_LENGTH) {
    return false;
  }
  for (const char ch : normalized) {
    if (SECRET_CODE_ALPHABET.find(ch) == std::string_view::npos) {
      return false;
    }
  }
  return true;
}

common::Result<std::string> make_identifier(const std::string &prefix,
                                            const common::TimestampMs now,
                                            const std::size_t random_chars,
                                            const RandomFill &fill) {
  static constexpr std::string_view BASE36 = "0123456789abcdefghijklmnopqrstuvwxyz";
  if (!fill) {
    return common::Result<std::string>::failure("Entropy unavailable: no random source");
  }
  auto suffix = draw_symbols(fill, BASE36, random_chars);
  if (!suffix.ok()) {
    return suffix;
  }
  const auto stamp = common::to_base36(static_cast<std::uint64_t>(now < 0 ? 0 : now));
  return common::Result<std::string>::success(prefix + "_" + stamp + "_" + suffix.value());
}

} // namespace couponvault::coupons

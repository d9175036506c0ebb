#pragma once

#include "couponvault/common/clock.hpp"
#include "couponvault/common/result.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace couponvault::coupons {

// 32 symbols: upper-case letters and digits without the look-alikes 0/O and 1/I.
inline constexpr std::string_view SECRET_CODE_ALPHABET = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
inline constexpr std::size_t SECRET_CODE_LENGTH = 12;
inline constexpr std::size_t SECRET_CODE_GROUP = 4;
inline constexpr char SECRET_CODE_DELIMITER = '-';

using RandomFill = std::function<common::Status(unsigned char *, std::size_t)>;

class ICodeGenerator {
public:
  virtual ~ICodeGenerator() = default;

  /// "ABCD-EFGH-JKLM". Fails when no secure entropy is available.
  [[nodiscard]] virtual common::Result<std::string> generate() = 0;
};

class SecretCodeGenerator final : public ICodeGenerator {
public:
  SecretCodeGenerator();
  explicit SecretCodeGenerator(RandomFill fill);

  [[nodiscard]] common::Result<std::string> generate() override;

private:
  RandomFill fill_;
};

[[nodiscard]] std::string normalize_code(const std::string &raw);

[[nodiscard]] std::string format_code(const std::string &normalized);

[[nodiscard]] bool is_well_formed_code(const std::string &normalized);

[[nodiscard]] common::Result<std::string>
make_identifier(const std::string &prefix, common::TimestampMs now, std::size_t random_chars,
                const RandomFill &fill);

} // namespace couponvault::coupons

#pragma once

#include <cstdint>
#include <string>

namespace couponvault::common {

using TimestampMs = std::int64_t;

inline constexpr TimestampMs kMillisPerSecond = 1000;
inline constexpr TimestampMs kMillisPerDay = 24LL * 60 * 60 * kMillisPerSecond;

class Clock {
public:
  virtual ~Clock() = default;
  [[nodiscard]] virtual TimestampMs now_ms() const = 0;
};

class SystemClock final : public Clock {
public:
  [[nodiscard]] TimestampMs now_ms() const override;
};

[[nodiscard]] Clock &system_clock();

// 2026-01-31T09:15:00Z
[[nodiscard]] std::string format_timestamp(TimestampMs ms);

[[nodiscard]] std::string to_base36(std::uint64_t value);

} // namespace couponvault::common

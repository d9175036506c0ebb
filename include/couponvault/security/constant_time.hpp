#pragma once

#include <string>

namespace couponvault::security {

[[nodiscard]] std::string sha256_hex(const std::string &text);

/// Both sides are hashed to a fixed width first, so length and mismatch position do not
/// change the running time.
[[nodiscard]] bool constant_time_equals(const std::string &a, const std::string &b);

} // namespace couponvault::security

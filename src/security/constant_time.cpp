#include "couponvault/security/constant_time.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace couponvault::security {

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

bool constant_time_equals(const std::string &a, const std::string &b) {
  const auto hash_a = sha256_hex(a);
  const auto hash_b = sha256_hex(b);

  const std::size_t max_size = std::max(hash_a.size(), hash_b.size());
  unsigned char diff = static_cast<unsigned char>(hash_a.size() ^ hash_b.size());
  // Hashes agree on a length mismatch only with negligible probability; fold it in anyway.
  diff |= static_cast<unsigned char>((a.size() ^ b.size()) != 0 ? 1 : 0);

  for (std::size_t i = 0; i < max_size; ++i) {
    const unsigned char lhs = i < hash_a.size() ? static_cast<unsigned char>(hash_a[i]) : 0;
    const unsigned char rhs = i < hash_b.size() ? static_cast<unsigned char>(hash_b[i]) : 0;
    diff |= static_cast<unsigned char>(lhs ^ rhs);
  }

  return diff == 0;
}

} // namespace couponvault::security

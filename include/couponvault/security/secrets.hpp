#pragma once

#include "couponvault/common/result.hpp"

#include <array>
#include <cstddef>
#include <filesystem>
#include <string>

namespace couponvault::security {

using SecretKey = std::array<unsigned char, 32>;

[[nodiscard]] common::Status secure_random_bytes(unsigned char *out, std::size_t size);

[[nodiscard]] common::Result<SecretKey> generate_key();

[[nodiscard]] common::Result<SecretKey> load_or_create_key(const std::filesystem::path &path);

[[nodiscard]] common::Result<std::string> encrypt_secret(const SecretKey &key,
                                                         const std::string &plaintext);

/// Inverse of encrypt_secret. Anything without the prefix, or failing authentication, is an
/// error; raw input is never passed through as plaintext.
[[nodiscard]] common::Result<std::string> decrypt_secret(const SecretKey &key,
                                                         const std::string &ciphertext);

[[nodiscard]] bool is_encrypted_blob(const std::string &value);

// "ABCD..."; values no longer than `shown` are fully masked.
[[nodiscard]] std::string mask_secret(const std::string &value, std::size_t shown = 4);

} // namespace couponvault::security

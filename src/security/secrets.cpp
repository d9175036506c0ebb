#include "couponvault/security/secrets.hpp"

#include "couponvault/common/fs.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <vector>

#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace couponvault::security {

namespace {

constexpr std::size_t NONCE_SIZE = 12;
constexpr std::size_t TAG_SIZE = 16;
constexpr const char *BLOB_PREFIX = "enc1:";
constexpr std::size_t BLOB_PREFIX_SIZE = 5;

std::string b64_encode(const std::vector<unsigned char> &bytes) {
  const int output_len = 4 * static_cast<int>((bytes.size() + 2) / 3);
  std::string output(static_cast<std::size_t>(output_len), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()), bytes.data(),
                  static_cast<int>(bytes.size()));
  return output;
}

common::Result<std::vector<unsigned char>> b64_decode(const std::string &text) {
  if (text.empty() || text.size() % 4 != 0) {
    return common::Result<std::vector<unsigned char>>::failure("Invalid base64 input");
  }

  std::vector<unsigned char> decoded(text.size());
  const int len = EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char *>(text.data()),
                                  static_cast<int>(text.size()));
  if (len < 0) {
    return common::Result<std::vector<unsigned char>>::failure("Invalid base64 input");
  }

  std::size_t padding = 0;
  if (text.back() == '=') {
    ++padding;
  }
  if (text.size() > 1 && text[text.size() - 2] == '=') {
    ++padding;
  }
  if (static_cast<std::size_t>(len) < padding) {
    return common::Result<std::vector<unsigned char>>::failure("Invalid base64 padding");
  }

  decoded.resize(static_cast<std::size_t>(len) - padding);
  return common::Result<std::vector<unsigned char>>::success(std::move(decoded));
}

common::Result<std::vector<unsigned char>>
chacha_encrypt(const SecretKey &key, const std::array<unsigned char, NONCE_SIZE> &nonce,
               const std::string &plaintext) {
  EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
  if (ctx == nullptr) {
    return common::Result<std::vector<unsigned char>>::failure("Failed to create cipher context");
  }

  std::vector<unsigned char> ciphertext(plaintext.size() + TAG_SIZE);
  int out_len = 0;
  int total_len = 0;

  auto cleanup = [&ctx]() { EVP_CIPHER_CTX_free(ctx); };

  if (EVP_EncryptInit_ex(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1) {
    cleanup();
    return common::Result<std::vector<unsigned char>>::failure("Encrypt init failed");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, NONCE_SIZE, nullptr) != 1) {
    cleanup();
    return common::Result<std::vector<unsigned char>>::failure("Failed to set nonce size");
  }
  if (EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data()) != 1) {
    cleanup();
    return common::Result<std::vector<unsigned char>>::failure("Failed to set key/nonce");
  }
  if (EVP_EncryptUpdate(ctx, ciphertext.data(), &out_len,
                        reinterpret_cast<const unsigned char *>(plaintext.data()),
                        static_cast<int>(plaintext.size())) != 1) {
    cleanup();
    return common::Result<std::vector<unsigned char>>::failure("Encrypt update failed");
  }
  total_len += out_len;

  if (EVP_EncryptFinal_ex(ctx, ciphertext.data() + total_len, &out_len) != 1) {
    cleanup();
    return common::Result<std::vector<unsigned char>>::failure("Encrypt final failed");
  }
  total_len += out_len;

  std::array<unsigned char, TAG_SIZE> tag{};
  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_GET_TAG, TAG_SIZE, tag.data()) != 1) {
    cleanup();
    return common::Result<std::vector<unsigned char>>::failure("Failed to get tag");
  }

  cleanup();
  ciphertext.resize(static_cast<std::size_t>(total_len));
  ciphertext.insert(ciphertext.end(), tag.begin(), tag.end());
  return common::Result<std::vector<unsigned char>>::success(std::move(ciphertext));
}

common::Result<std::string>
chacha_decrypt(const SecretKey &key, const std::array<unsigned char, NONCE_SIZE> &nonce,
               const std::vector<unsigned char> &ciphertext_with_tag) {
  if (ciphertext_with_tag.size() < TAG_SIZE) {
    return common::Result<std::string>::failure("Ciphertext too short");
  }

  const std::size_t data_size = ciphertext_with_tag.size() - TAG_SIZE;
  const unsigned char *tag = ciphertext_with_tag.data() + data_size;

  EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
  if (ctx == nullptr) {
    return common::Result<std::string>::failure("Failed to create cipher context");
  }

  std::vector<unsigned char> plaintext(data_size + TAG_SIZE);
  int out_len = 0;
  int total_len = 0;

  auto cleanup = [&ctx]() { EVP_CIPHER_CTX_free(ctx); };

  if (EVP_DecryptInit_ex(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1) {
    cleanup();
    return common::Result<std::string>::failure("Decrypt init failed");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, NONCE_SIZE, nullptr) != 1) {
    cleanup();
    return common::Result<std::string>::failure("Failed to set nonce size");
  }
  if (EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data()) != 1) {
    cleanup();
    return common::Result<std::string>::failure("Failed to set key/nonce");
  }

  if (EVP_DecryptUpdate(ctx, plaintext.data(), &out_len, ciphertext_with_tag.data(),
                        static_cast<int>(data_size)) != 1) {
    cleanup();
    return common::Result<std::string>::failure("Decrypt update failed");
  }
  total_len += out_len;

  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG, TAG_SIZE,
                          const_cast<unsigned char *>(tag)) != 1) {
    cleanup();
    return common::Result<std::string>::failure("Failed to set tag");
  }

  if (EVP_DecryptFinal_ex(ctx, plaintext.data() + total_len, &out_len) != 1) {
    cleanup();
    return common::Result<std::string>::failure("Decryption failed");
  }
  total_len += out_len;

  cleanup();
  return common::Result<std::string>::success(
      std::string(reinterpret_cast<const char *>(plaintext.data()), static_cast<std::size_t>(total_len)));
}

} // namespace

common::Status secure_random_bytes(unsigned char *out, const std::size_t size) {
  if (size == 0) {
    return common::Status::success();
  }
  if (RAND_bytes(out, static_cast<int>(size)) != 1) {
    return common::Status::error("Secure random source unavailable");
  }
  return common::Status::success();
}

common::Result<SecretKey> generate_key() {
  SecretKey key{};
  if (const auto status = secure_random_bytes(key.data(), key.size()); !status.ok()) {
    return common::Result<SecretKey>::failure(status.error());
  }
  return common::Result<SecretKey>::success(key);
}

common::Result<SecretKey> load_or_create_key(const std::filesystem::path &path) {
  if (std::filesystem::exists(path)) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      return common::Result<SecretKey>::failure("Failed to read key file");
    }
    SecretKey key{};
    in.read(reinterpret_cast<char *>(key.data()), static_cast<std::streamsize>(key.size()));
    if (in.gcount() != static_cast<std::streamsize>(key.size())) {
      return common::Result<SecretKey>::failure("Key file has invalid size");
    }
    return common::Result<SecretKey>::success(key);
  }

  const auto key = generate_key();
  if (!key.ok()) {
    return key;
  }

  const std::string raw(reinterpret_cast<const char *>(key.value().data()), key.value().size());
  if (const auto written = common::write_file_atomic(path, raw, true); !written.ok()) {
    return common::Result<SecretKey>::failure("Failed to write key file: " + written.error());
  }

  return key;
}

common::Result<std::string> encrypt_secret(const SecretKey &key, const std::string &plaintext) {
  std::array<unsigned char, NONCE_SIZE> nonce{};
  if (const auto status = secure_random_bytes(nonce.data(), nonce.size()); !status.ok()) {
    return common::Result<std::string>::failure(status.error());
  }

  const auto ciphertext = chacha_encrypt(key, nonce, plaintext);
  if (!ciphertext.ok()) {
    return common::Result<std::string>::failure(ciphertext.error());
  }

  std::vector<unsigned char> blob;
  blob.reserve(NONCE_SIZE + ciphertext.value().size());
  blob.insert(blob.end(), nonce.begin(), nonce.end());
  blob.insert(blob.end(), ciphertext.value().begin(), ciphertext.value().end());

  return common::Result<std::string>::success(BLOB_PREFIX + b64_encode(blob));
}

common::Result<std::string> decrypt_secret(const SecretKey &key, const std::string &ciphertext) {
  if (!is_encrypted_blob(ciphertext)) {
    return common::Result<std::string>::failure("Record is not an encrypted blob");
  }

  const auto decoded = b64_decode(ciphertext.substr(BLOB_PREFIX_SIZE));
  if (!decoded.ok()) {
    return common::Result<std::string>::failure(decoded.error());
  }

  if (decoded.value().size() < NONCE_SIZE + TAG_SIZE) {
    return common::Result<std::string>::failure("Ciphertext too short");
  }

  std::array<unsigned char, NONCE_SIZE> nonce{};
  std::copy_n(decoded.value().begin(), NONCE_SIZE, nonce.begin());

  std::vector<unsigned char> payload(decoded.value().begin() + static_cast<long>(NONCE_SIZE),
                                     decoded.value().end());

  return chacha_decrypt(key, nonce, payload);
}

bool is_encrypted_blob(const std::string &value) { return common::starts_with(value, BLOB_PREFIX); }

std::string mask_secret(const std::string &value, const std::size_t shown) {
  if (value.size() <= shown) {
    return "***";
  }
  return value.substr(0, shown) + "...";
}

} // namespace couponvault::security

#include "couponvault/storage/file_kv_store.hpp"

#include "couponvault/common/fs.hpp"

#include <cctype>

namespace couponvault::storage {

FileKeyValueStore::FileKeyValueStore(std::filesystem::path directory,
                                     const std::size_t max_value_bytes)
    : directory_(std::move(directory)), max_value_bytes_(max_value_bytes) {}

common::Result<std::filesystem::path> FileKeyValueStore::path_for(const std::string &key) const {
  if (key.empty()) {
    return common::Result<std::filesystem::path>::failure("empty key");
  }
  for (const char ch : key) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) == 0 && ch != '.' && ch != '_' && ch != '-') {
      return common::Result<std::filesystem::path>::failure("invalid key: " + key);
    }
  }
  if (key.front() == '.') {
    return common::Result<std::filesystem::path>::failure("invalid key: " + key);
  }
  return common::Result<std::filesystem::path>::success(directory_ / key);
}

common::Result<std::optional<std::string>> FileKeyValueStore::get(const std::string &key) {
  using ReadResult = common::Result<std::optional<std::string>>;
  const auto path = path_for(key);
  if (!path.ok()) {
    return ReadResult::failure(path.error());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  if (!std::filesystem::exists(path.value(), ec)) {
    return ReadResult::success(std::nullopt);
  }
  const auto content = common::read_file(path.value());
  if (!content.ok()) {
    return ReadResult::failure(content.error());
  }
  return ReadResult::success(content.value());
}

common::Status FileKeyValueStore::put(const std::string &key, const std::string &value) {
  const auto path = path_for(key);
  if (!path.ok()) {
    return common::Status::error(path.error());
  }
  if (max_value_bytes_ > 0 && value.size() > max_value_bytes_) {
    return common::Status::error("value for " + key + " exceeds " +
                                 std::to_string(max_value_bytes_) + " bytes");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  return common::write_file_atomic(path.value(), value, true);
}

common::Status FileKeyValueStore::remove(const std::string &key) {
  const auto path = path_for(key);
  if (!path.ok()) {
    return common::Status::error(path.error());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  std::filesystem::remove(path.value(), ec);
  if (ec) {
    return common::Status::error("Failed to remove " + key + ": " + ec.message());
  }
  return common::Status::success();
}

} // namespace couponvault::storage

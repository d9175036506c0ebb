#pragma once

#include "couponvault/storage/key_value_store.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>

namespace couponvault::storage {

// One owner-only file per key. A non-zero `max_value_bytes` rejects larger values.
class FileKeyValueStore final : public IKeyValueStore {
public:
  explicit FileKeyValueStore(std::filesystem::path directory, std::size_t max_value_bytes = 0);

  [[nodiscard]] common::Result<std::optional<std::string>> get(const std::string &key) override;
  [[nodiscard]] common::Status put(const std::string &key, const std::string &value) override;
  [[nodiscard]] common::Status remove(const std::string &key) override;
  [[nodiscard]] std::string_view name() const override { return "file"; }

  [[nodiscard]] std::size_t max_value_bytes() const { return max_value_bytes_; }

private:
  [[nodiscard]] common::Result<std::filesystem::path> path_for(const std::string &key) const;

  std::filesystem::path directory_;
  std::size_t max_value_bytes_;
  std::mutex mutex_;
};

} // namespace couponvault::storage

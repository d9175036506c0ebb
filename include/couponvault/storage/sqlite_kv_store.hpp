#pragma once

#include "couponvault/storage/key_value_store.hpp"

#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace couponvault::storage {

class SqliteKeyValueStore final : public IKeyValueStore {
public:
  explicit SqliteKeyValueStore(std::filesystem::path db_path);
  ~SqliteKeyValueStore() override;

  SqliteKeyValueStore(const SqliteKeyValueStore &) = delete;
  SqliteKeyValueStore &operator=(const SqliteKeyValueStore &) = delete;

  [[nodiscard]] common::Result<std::optional<std::string>> get(const std::string &key) override;
  [[nodiscard]] common::Status put(const std::string &key, const std::string &value) override;
  [[nodiscard]] common::Status remove(const std::string &key) override;
  [[nodiscard]] std::string_view name() const override { return "sqlite"; }

  [[nodiscard]] bool is_open() const { return db_ != nullptr; }
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

private:
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace couponvault::storage

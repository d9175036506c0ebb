#include "couponvault/storage/sqlite_kv_store.hpp"

#include "couponvault/common/clock.hpp"
#include "couponvault/observability/global.hpp"

namespace couponvault::storage {

namespace {

constexpr int BUSY_TIMEOUT_MS = 2000;

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

} // namespace

SqliteKeyValueStore::SqliteKeyValueStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (!db_path_.parent_path().empty()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    observability::record_error("storage.sqlite",
                                "cannot open " + db_path_.string() + ": " +
                                    (db_ != nullptr ? sqlite3_errmsg(db_) : "out of memory"));
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }

  if (const auto status = init_schema(); !status.ok()) {
    observability::record_error("storage.sqlite", "schema init failed: " + status.error());
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteKeyValueStore::~SqliteKeyValueStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteKeyValueStore::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }
  // A second handle on the same file waits for the writer instead of failing with SQLITE_BUSY.
  status = exec_sql(db_, "PRAGMA busy_timeout=" + std::to_string(BUSY_TIMEOUT_MS) + ";");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS kv (
  key TEXT PRIMARY KEY,
  value TEXT NOT NULL,
  updated_at INTEGER NOT NULL
);
)");
}

common::Result<std::optional<std::string>> SqliteKeyValueStore::get(const std::string &key) {
  using ReadResult = common::Result<std::optional<std::string>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return ReadResult::failure("database is not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT value FROM kv WHERE key = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return ReadResult::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
    const int bytes = sqlite3_column_bytes(stmt, 0);
    std::string value = text == nullptr ? std::string() : std::string(text, static_cast<std::size_t>(bytes));
    sqlite3_finalize(stmt);
    return ReadResult::success(std::move(value));
  }

  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return ReadResult::failure(sqlite3_errmsg(db_));
  }
  return ReadResult::success(std::nullopt);
}

common::Status SqliteKeyValueStore::put(const std::string &key, const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("database is not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT OR REPLACE INTO kv(key, value, updated_at) VALUES(?1, ?2, ?3)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 3, common::system_clock().now_ms());

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Status SqliteKeyValueStore::remove(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("database is not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "DELETE FROM kv WHERE key = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

} // namespace couponvault::storage

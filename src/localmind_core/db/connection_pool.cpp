#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>

#include "localmind_core/db/connection_pool.hpp"

#include "localmind_core/db/sqlite_error_utils.hpp"
#include "localmind_core/errors.hpp"

namespace localmind_core {

std::unique_ptr<sqlite::database> ConnectionPool::open_keyed(const std::string& db_path,
                                                             const std::string& db_key,
                                                             std::chrono::milliseconds busy_timeout) {
  std::unique_ptr<sqlite::database> db;
  try {
    db = std::make_unique<sqlite::database>(db_path);
  } catch (const sqlite::sqlite_exception& e) {
    throw to_storage_error("open " + db_path, e);
  }

  sqlite3* handle = db->connection().get();
  if (!handle) {
    throw StorageError("Failed to get native handle for connection to " + db_path);
  }

  if (sqlite3_key(handle, db_key.c_str(), static_cast<int>(db_key.length())) != SQLITE_OK) {
    throw StorageError("Failed to key database: " + std::string(sqlite3_errmsg(handle)));
  }

  try {
    // A wrong key only surfaces on the first read.
    *db << "SELECT count(*) FROM sqlite_master;";
    *db << "PRAGMA foreign_keys = ON;";
    *db << "PRAGMA journal_mode = WAL;";
  } catch (const sqlite::sqlite_exception& e) {
    throw to_storage_error("verify key for " + db_path, e);
  }
  sqlite3_busy_timeout(handle, static_cast<int>(busy_timeout.count()));
  return db;
}

ConnectionPool::ConnectionPool(const std::string& db_path,
                               const std::string& db_key,
                               int pool_size,
                               std::chrono::milliseconds busy_timeout)
    : db_path_(db_path), db_key_(db_key) {
  if (pool_size <= 0) {
    throw StorageError("Connection pool size must be positive");
  }
  for (int i = 0; i < pool_size; ++i) {
    pool_.push(open_keyed(db_path_, db_key_, busy_timeout));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return shutting_down_ || !pool_.empty(); });

  if (shutting_down_) {
    throw StorageError("Connection pool is shut down");
  }

  std::unique_ptr<sqlite::database> conn = std::move(pool_.front());
  pool_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!shutting_down_) {
    pool_.push(std::move(conn));
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  std::lock_guard<std::mutex> lock(mtx_);
  shutting_down_ = true;
  while (!pool_.empty()) {
    pool_.pop();
  }
  cv_.notify_all();
}

size_t ConnectionPool::available() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return pool_.size();
}

}  // namespace localmind_core

#include "localmind_core/db/database_manager.hpp"

#include <iostream>

#include "localmind_core/db/sqlite_error_utils.hpp"
#include "localmind_core/errors.hpp"

namespace localmind_core {

DatabaseManager& DatabaseManager::get_instance() {
  static DatabaseManager instance;
  return instance;
}

void DatabaseManager::initialize(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pool_) {
    return;
  }
  if (db_key.empty()) {
    throw StorageError("Database key must not be empty");
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // Schema setup runs on its own connection before any pooled connection exists.
  setup_schema(db_path, db_key);

  pool_ = std::make_shared<ConnectionPool>(db_path.string(), db_key, pool_size);
  std::cout << "[DatabaseManager] Opened " << db_path.string() << " with " << pool_size
            << " pooled connections." << std::endl;
}

void DatabaseManager::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!pool_) {
    return;
  }
  pool_->shutdown();
  pool_.reset();
}

bool DatabaseManager::is_initialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pool_ != nullptr;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  std::shared_ptr<ConnectionPool> pool;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pool = pool_;
  }
  if (!pool) {
    throw StorageError("DatabaseManager has not been initialized.");
  }
  return pool->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  std::shared_ptr<ConnectionPool> pool;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pool = pool_;
  }
  if (!pool) {
    return;
  }
  pool->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path, const std::string& db_key) {
  auto db_ptr = ConnectionPool::open_keyed(db_path.string(), db_key, std::chrono::milliseconds(5000));
  sqlite::database& db = *db_ptr;

  try {
    // documents and chunks back the vector index; chunk ids are the index ids
    db << R"(
        CREATE TABLE IF NOT EXISTS documents (
            id TEXT PRIMARY KEY,
            content_hash TEXT NOT NULL,
            file_type TEXT NOT NULL,
            file_size INTEGER NOT NULL,
            chunk_count INTEGER NOT NULL DEFAULT 0,
            ingested_at TEXT NOT NULL
        )
      )";

    db << R"(
        CREATE TABLE IF NOT EXISTS chunks (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            document_id TEXT NOT NULL,
            chunk_index INTEGER NOT NULL,
            start_offset INTEGER NOT NULL,
            end_offset INTEGER NOT NULL,
            content BLOB NOT NULL,
            categories TEXT NOT NULL DEFAULT '[]',
            vector_blob BLOB NOT NULL,
            FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE CASCADE
        )
      )";
    db << R"(
        CREATE INDEX IF NOT EXISTS idx_chunks_document
        ON chunks(document_id, chunk_index)
      )";

    // snapshot_version lives here and must match the persisted index manifest
    db << R"(
        CREATE TABLE IF NOT EXISTS store_meta (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        )
      )";
    db << "INSERT OR IGNORE INTO store_meta (key, value) VALUES ('snapshot_version', '0')";

    db << R"(
        CREATE TABLE IF NOT EXISTS conversations (
            id TEXT PRIMARY KEY,
            title TEXT NOT NULL,
            category TEXT,
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL
        )
      )";

    db << R"(
        CREATE TABLE IF NOT EXISTS turns (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            conversation_id TEXT NOT NULL,
            user_query TEXT NOT NULL,
            response TEXT NOT NULL,
            category TEXT,
            keywords TEXT NOT NULL DEFAULT '[]',
            retrieved_chunk_ids TEXT NOT NULL DEFAULT '[]',
            tool_calls TEXT NOT NULL DEFAULT '[]',
            created_at TEXT NOT NULL,
            FOREIGN KEY (conversation_id) REFERENCES conversations(id) ON DELETE CASCADE
        )
      )";
    db << R"(
        CREATE INDEX IF NOT EXISTS idx_turns_conversation
        ON turns(conversation_id, id)
      )";

    db << R"(
        CREATE TABLE IF NOT EXISTS categories (
            name TEXT PRIMARY KEY,
            description TEXT NOT NULL DEFAULT '',
            color TEXT NOT NULL DEFAULT '#007bff',
            created_at TEXT NOT NULL
        )
      )";

    db << R"(
        CREATE TABLE IF NOT EXISTS task_queue (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            task_type TEXT NOT NULL,
            status TEXT NOT NULL DEFAULT 'PENDING',
            priority INTEGER NOT NULL DEFAULT 10,
            target_path TEXT,
            error_message TEXT,
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL
        )
      )";
    db << R"(
        CREATE TABLE IF NOT EXISTS task_progress (
            task_id INTEGER PRIMARY KEY,
            progress_percent REAL NOT NULL DEFAULT 0.0,
            status_message TEXT NOT NULL DEFAULT 'Initializing...',
            updated_at TEXT NOT NULL,
            FOREIGN KEY (task_id) REFERENCES task_queue(id) ON DELETE CASCADE
        )
      )";
    db << R"(
        CREATE INDEX IF NOT EXISTS idx_task_queue_status_priority
        ON task_queue(status, priority, created_at)
      )";
  } catch (const sqlite::sqlite_exception& e) {
    throw to_storage_error("setup_schema", e);
  }
}

}  // namespace localmind_core

#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "localmind_core/db/connection_pool.hpp"

namespace localmind_core {

// Process-wide owner of the encrypted database. Creates the schema once and
// hands out pooled connections.
class DatabaseManager {
 public:
  static DatabaseManager& get_instance();

  // Must be called once at startup. Repeated calls are ignored until shutdown().
  void initialize(const std::filesystem::path& db_path, const std::string& db_key, int pool_size);

  // Used by the PooledConnection guard.
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();
  bool is_initialized() const;

  DatabaseManager(const DatabaseManager&) = delete;
  DatabaseManager& operator=(const DatabaseManager&) = delete;

 private:
  DatabaseManager() = default;
  void setup_schema(const std::filesystem::path& db_path, const std::string& db_key);

  std::shared_ptr<ConnectionPool> pool_;
  mutable std::mutex mutex_;
};

}  // namespace localmind_core

#pragma once
#include <sqlite_modern_cpp.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace localmind_core {

// Fixed-size pool of keyed SQLCipher connections.
class ConnectionPool {
 public:
  ConnectionPool(const std::string& db_path,
                 const std::string& db_key,
                 int pool_size,
                 std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));

  // Blocks until a connection is free. Throws StorageError once shut down.
  std::unique_ptr<sqlite::database> get_connection();

  void return_connection(std::unique_ptr<sqlite::database> conn);
  void shutdown();

  size_t available() const;

  // Opens and keys a single connection outside of any pool.
  static std::unique_ptr<sqlite::database> open_keyed(const std::string& db_path,
                                                      const std::string& db_key,
                                                      std::chrono::milliseconds busy_timeout);

 private:
  bool shutting_down_ = false;
  std::string db_path_;
  std::string db_key_;
  std::queue<std::unique_ptr<sqlite::database>> pool_;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace localmind_core

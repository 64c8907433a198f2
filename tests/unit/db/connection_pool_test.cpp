#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <string>
#include <thread>

#include "../../common/utilities_test.hpp"
#include "localmind_core/db/database_manager.hpp"
#include "localmind_core/db/pooled_connection.hpp"

namespace localmind_core {

class ConnectionPoolTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_db_path_ = localmind_tests::TestUtilities::create_temp_test_db();
    auto& mgr = DatabaseManager::get_instance();
    mgr.shutdown();
    mgr.initialize(temp_db_path_, "localmind_test_key", /*pool_size*/ 4);
  }

  void TearDown() override {
    DatabaseManager::get_instance().shutdown();
    localmind_tests::TestUtilities::cleanup_temp_db(temp_db_path_);
  }

  std::filesystem::path temp_db_path_;
};

TEST_F(ConnectionPoolTest, CanBorrowAndReturnConnections) {
  auto& mgr = DatabaseManager::get_instance();

  PooledConnection c1(mgr);
  PooledConnection c2(mgr);

  int count = 0;
  *c1 << "SELECT COUNT(*) FROM sqlite_master" >> count;
  EXPECT_GT(count, 0);
}

TEST_F(ConnectionPoolTest, BlocksWhenPoolExhaustedAndResumes) {
  auto& mgr = DatabaseManager::get_instance();

  auto holder1 = std::make_unique<PooledConnection>(mgr);
  auto holder2 = std::make_unique<PooledConnection>(mgr);
  auto holder3 = std::make_unique<PooledConnection>(mgr);
  auto holder4 = std::make_unique<PooledConnection>(mgr);

  std::promise<void> start_promise;
  std::shared_future<void> start_future(start_promise.get_future());

  std::atomic<bool> acquired{false};
  std::thread t([&]() {
    start_future.wait();
    PooledConnection c5(mgr);
    int count = 0;
    *c5 << "SELECT COUNT(*) FROM sqlite_master" >> count;
    acquired.store(true);
  });

  start_promise.set_value();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(acquired.load());
  holder1.reset();

  t.join();
  EXPECT_TRUE(acquired.load());
}

TEST_F(ConnectionPoolTest, RejectsNonPositivePoolSize) {
  EXPECT_THROW(ConnectionPool(temp_db_path_.string(), "localmind_test_key", 0), StorageError);
}

}  // namespace localmind_core

#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>

#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "localmind_core/db/connection_pool.hpp"
#include "localmind_core/db/pooled_connection.hpp"

namespace localmind_core {

class DatabaseManagerTest : public localmind_tests::DatabaseTestBase {};

TEST_F(DatabaseManagerTest, CreatesSchema_OnInitialization) {
  std::vector<std::string> required_tables = {"documents", "chunks",     "store_meta",   "conversations",
                                              "turns",     "categories", "task_queue", "task_progress"};

  PooledConnection conn(*db_manager_);
  for (const auto& table : required_tables) {
    int count = 0;
    *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?" << table >> count;
    EXPECT_EQ(count, 1) << "Missing table: " << table;
  }
}

TEST_F(DatabaseManagerTest, HasIndexesAndPragmas_Applied) {
  PooledConnection conn(*db_manager_);

  int idx_count = 0;
  *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='index' AND name='idx_task_queue_status_priority'" >>
      idx_count;
  EXPECT_EQ(idx_count, 1);

  int fk_on = 0;
  *conn << "PRAGMA foreign_keys;" >> fk_on;
  EXPECT_EQ(fk_on, 1);
}

TEST_F(DatabaseManagerTest, SnapshotVersionStartsAtZero) {
  EXPECT_EQ(chunk_store_->snapshot_version(), 0u);
}

TEST_F(DatabaseManagerTest, ReopenWithWrongKey_Fails) {
  EXPECT_THROW({ ConnectionPool bad_pool(temp_db_path_.string(), "incorrect_test_key", 1); }, StorageError);
}

TEST_F(DatabaseManagerTest, RepeatedInitializeIsIgnored) {
  EXPECT_NO_THROW(db_manager_->initialize(temp_db_path_, "localmind_test_key", 2));
  EXPECT_TRUE(db_manager_->is_initialized());
}

}  // namespace localmind_core

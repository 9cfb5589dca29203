#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>
#include <string>
#include <vector>

#include "finmda_core/db/sqlite_error_utils.hpp"
#include "finmda_core/db/transaction.hpp"
#include "utilities_test.hpp"

namespace finmda_tests {

using namespace finmda_core;

class DatabaseManagerTest : public DatabaseTestBase {};

TEST_F(DatabaseManagerTest, CreatesSchema_OnInitialization) {
  std::vector<std::string> required_tables = {"chunks", "task_queue", "task_progress",
                                              "index_info"};

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
  *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='index' AND "
           "name IN ('idx_task_queue_claim', 'idx_chunks_document')" >>
      idx_count;
  EXPECT_EQ(idx_count, 2);

  int fk_on = 0;
  *conn << "PRAGMA foreign_keys;" >> fk_on;
  EXPECT_EQ(fk_on, 1);

  std::string journal_mode;
  *conn << "PRAGMA journal_mode;" >> journal_mode;
  EXPECT_EQ(journal_mode, "wal");
}

TEST_F(DatabaseManagerTest, SchemaSetupIsIdempotent) {
  EXPECT_EQ(db_manager_->schema_version(), DatabaseManager::kSchemaVersion);
  long long task_id = task_queue_repo_->enqueue_index_document("doc", "text");
  reopen_database();
  EXPECT_EQ(db_manager_->schema_version(), DatabaseManager::kSchemaVersion);
  EXPECT_TRUE(task_queue_repo_->get_task(task_id).has_value());
}

TEST_F(DatabaseManagerTest, RefusesNewerSchema) {
  {
    PooledConnection conn(*db_manager_);
    *conn << "PRAGMA user_version = 99;";
  }
  EXPECT_THROW(DatabaseManager(temp_db_path_, 1), std::runtime_error);
}

TEST_F(DatabaseManagerTest, TransactionRollsBackUnlessCommitted) {
  PooledConnection conn(*db_manager_);
  {
    Transaction tx(*conn);
    *conn << "INSERT INTO index_info (key, value) VALUES ('dimension', '16')";
  }
  int count = -1;
  *conn << "SELECT COUNT(*) FROM index_info" >> count;
  EXPECT_EQ(count, 0);

  {
    Transaction tx(*conn, TransactionMode::Immediate);
    *conn << "INSERT INTO index_info (key, value) VALUES ('dimension', '16')";
    tx.commit();
  }
  *conn << "SELECT COUNT(*) FROM index_info" >> count;
  EXPECT_EQ(count, 1);
}

TEST_F(DatabaseManagerTest, ConstraintErrorsAreClassified) {
  PooledConnection conn(*db_manager_);
  *conn << "INSERT INTO index_info (key, value) VALUES ('dimension', '16')";
  try {
    *conn << "INSERT INTO index_info (key, value) VALUES ('dimension', '32')";
    FAIL() << "Expected a constraint violation";
  } catch (const sqlite::sqlite_exception& e) {
    DbFailure failure = inspect_db_error(e);
    EXPECT_EQ(failure.kind, DbErrorKind::Constraint);
    EXPECT_FALSE(failure.retryable);
    std::string message = format_db_error("insert_info", e);
    EXPECT_NE(message.find("insert_info failed: (constraint)"), std::string::npos);
    EXPECT_EQ(message.find("retryable"), std::string::npos);
  }
  EXPECT_STREQ(db_error_kind_name(DbErrorKind::BusyOrLocked), "busy_or_locked");
  EXPECT_STREQ(db_error_kind_name(DbErrorKind::Generic), "generic");
}

}  // namespace finmda_tests

#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "finmda_core/db/database_manager.hpp"
#include "finmda_core/db/pooled_connection.hpp"
#include "finmda_core/db/task_queue_repo.hpp"
#include "finmda_core/index/vector_index.hpp"
#include "finmda_core/types/financial.hpp"

namespace finmda_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Database utilities
  static std::filesystem::path create_temp_test_db();
  static void cleanup_temp_db(const std::filesystem::path& db_path);

  // Writes content to a fresh file under the temp test directory.
  static std::filesystem::path write_temp_file(const std::string& name, const std::string& content);
  static void remove_temp_path(const std::filesystem::path& path);

  static finmda_core::IndexItem create_test_item(const std::string& document_id,
                                                 int chunk_index,
                                                 const std::vector<float>& vector,
                                                 const std::string& text = "chunk text");

  struct ReplaceStressResult {
    size_t reads = 0;
    size_t torn_reads = 0;  // result sets mixing generations or missing chunks
  };

  // Reader threads query document "A" while the calling thread swaps it
  // between a four-chunk and a two-chunk generation with replace().
  static ReplaceStressResult run_replace_stress(finmda_core::VectorIndex& index, int rounds);

  static std::vector<finmda_core::TimeSeriesPoint> create_quarterly_points(
      const std::string& company,
      const std::string& concept_name,
      const std::vector<double>& values,
      int first_year = 2022);
};

/**
 * Base fixture that owns a DatabaseManager over a temporary database file.
 */
class DatabaseTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_db_path_ = TestUtilities::create_temp_test_db();
    db_manager_ = std::make_unique<finmda_core::DatabaseManager>(temp_db_path_, 4);
    task_queue_repo_ = std::make_shared<finmda_core::TaskQueueRepo>(*db_manager_);
  }

  void TearDown() override {
    task_queue_repo_.reset();
    if (db_manager_) {
      db_manager_->shutdown();
      db_manager_.reset();
    }
    TestUtilities::cleanup_temp_db(temp_db_path_);
  }

  // Drops and recreates the manager over the same file, as a process restart would.
  void reopen_database() {
    task_queue_repo_.reset();
    db_manager_->shutdown();
    db_manager_ = std::make_unique<finmda_core::DatabaseManager>(temp_db_path_, 4);
    task_queue_repo_ = std::make_shared<finmda_core::TaskQueueRepo>(*db_manager_);
  }

  std::filesystem::path temp_db_path_;
  std::unique_ptr<finmda_core::DatabaseManager> db_manager_;
  std::shared_ptr<finmda_core::TaskQueueRepo> task_queue_repo_;
};

}  // namespace finmda_tests

#include <gtest/gtest.h>

#include "finmda_core/async/delete_document_task.hpp"
#include "finmda_core/async/index_document_task.hpp"
#include "finmda_core/async/task_factory.hpp"

namespace finmda_tests {

using namespace finmda_core;

class TaskFactoryTest : public ::testing::Test {
 protected:
  TaskRecord make_record(const std::string& task_type, const std::string& document_id) {
    TaskRecord record;
    record.id = 42;
    record.task_type = task_type;
    record.document_id = document_id;
    record.status = TaskStatus::PROCESSING;
    record.created_at = std::chrono::system_clock::now();
    record.updated_at = record.created_at;
    return record;
  }
};

TEST_F(TaskFactoryTest, CreatesIndexDocumentTask) {
  TaskRecord record = make_record(task_types::INDEX_DOCUMENT, "10k-2024");
  record.payload = "Revenue grew.";
  record.metadata = {{"company", "ACME"}};

  ITaskPtr task = TaskFactory::create_task(record);

  ASSERT_NE(task, nullptr);
  EXPECT_STREQ(task->get_type(), task_types::INDEX_DOCUMENT);
  EXPECT_EQ(task->get_id(), 42);
  EXPECT_EQ(task->get_document_id(), "10k-2024");
  auto* index_task = dynamic_cast<IndexDocumentTask*>(task.get());
  ASSERT_NE(index_task, nullptr);
  EXPECT_EQ(index_task->get_text(), "Revenue grew.");
  EXPECT_EQ(index_task->get_metadata().at("company"), "ACME");
}

TEST_F(TaskFactoryTest, CreatesDeleteDocumentTask) {
  ITaskPtr task = TaskFactory::create_task(make_record(task_types::DELETE_DOCUMENT, "old"));

  EXPECT_STREQ(task->get_type(), task_types::DELETE_DOCUMENT);
  EXPECT_NE(dynamic_cast<DeleteDocumentTask*>(task.get()), nullptr);
}

TEST_F(TaskFactoryTest, RejectsUnknownTypeAndMissingDocument) {
  EXPECT_THROW(TaskFactory::create_task(make_record("PROCESS_NEW_FILE", "doc")),
               std::runtime_error);
  EXPECT_THROW(TaskFactory::create_task(make_record(task_types::INDEX_DOCUMENT, "")),
               std::runtime_error);
}

}  // namespace finmda_tests

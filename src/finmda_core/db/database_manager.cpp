#include "finmda_core/db/database_manager.hpp"

#include <iostream>
#include <stdexcept>

#include "finmda_core/db/pooled_connection.hpp"
#include "finmda_core/db/transaction.hpp"

namespace finmda_core {

namespace {

// Version 1 layout. Later versions append their own statement lists.
const char* const kSchemaV1[] = {
    R"(CREATE TABLE IF NOT EXISTS chunks (
           id TEXT PRIMARY KEY,
           document_id TEXT NOT NULL,
           chunk_index INTEGER NOT NULL,
           content BLOB,
           metadata TEXT NOT NULL,
           vector_blob BLOB NOT NULL,
           updated_at TEXT NOT NULL))",
    "CREATE INDEX IF NOT EXISTS idx_chunks_document ON chunks(document_id, chunk_index)",
    R"(CREATE TABLE IF NOT EXISTS task_queue (
           id INTEGER PRIMARY KEY AUTOINCREMENT,
           task_type TEXT NOT NULL,
           document_id TEXT NOT NULL,
           payload BLOB,
           metadata TEXT NOT NULL DEFAULT '{}',
           status TEXT NOT NULL DEFAULT 'PENDING',
           priority INTEGER NOT NULL DEFAULT 10,
           error_message TEXT,
           created_at TEXT NOT NULL,
           updated_at TEXT NOT NULL))",
    "CREATE INDEX IF NOT EXISTS idx_task_queue_claim "
    "ON task_queue(status, document_id, priority, id)",
    R"(CREATE TABLE IF NOT EXISTS task_progress (
           task_id INTEGER PRIMARY KEY,
           progress_percent REAL NOT NULL DEFAULT 0.0,
           status_message TEXT,
           updated_at TEXT NOT NULL,
           FOREIGN KEY (task_id) REFERENCES task_queue(id) ON DELETE CASCADE))",
    // key/value facts about the index itself, e.g. the embedding dimension
    R"(CREATE TABLE IF NOT EXISTS index_info (
           key TEXT PRIMARY KEY,
           value TEXT NOT NULL))",
};

}  // namespace

DatabaseManager::DatabaseManager(const std::filesystem::path& db_path,
                                 int pool_size,
                                 ConnectionOptions options)
    : db_path_(db_path) {
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path());
  }

  {
    // Schema changes go through one short-lived connection before any worker can borrow one.
    std::unique_ptr<sqlite::database> db = ConnectionPool::open(db_path_.string(), options);
    migrate(*db);
  }
  pool_ = std::make_unique<ConnectionPool>(db_path_.string(), pool_size, options);
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (pool_) {
    pool_->shutdown();
    pool_.reset();
  }
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!pool_) {
    throw std::runtime_error("DatabaseManager has been shut down.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (pool_) {
    pool_->return_connection(std::move(conn));
  }
}

int DatabaseManager::schema_version() {
  PooledConnection conn(*this);
  int version = 0;
  *conn << "PRAGMA user_version;" >> version;
  return version;
}

void DatabaseManager::migrate(sqlite::database& db) {
  int version = 0;
  db << "PRAGMA user_version;" >> version;
  if (version > kSchemaVersion) {
    throw std::runtime_error("Database " + db_path_.string() + " has schema version " +
                             std::to_string(version) + ", newer than supported version " +
                             std::to_string(kSchemaVersion));
  }
  if (version == kSchemaVersion) {
    return;
  }

  Transaction tx(db, TransactionMode::Immediate);
  for (const char* statement : kSchemaV1) {
    db << statement;
  }
  db << "PRAGMA user_version = " + std::to_string(kSchemaVersion) + ";";
  tx.commit();
  std::cout << "[DatabaseManager] Initialized schema v" << kSchemaVersion << " at "
            << db_path_.string() << std::endl;
}

}  // namespace finmda_core

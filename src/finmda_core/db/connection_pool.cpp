#include "finmda_core/db/connection_pool.hpp"

#include <stdexcept>

namespace finmda_core {

ConnectionPool::ConnectionPool(const std::string& db_path, int pool_size, ConnectionOptions options)
    : db_path_(db_path), pool_size_(pool_size) {
  if (pool_size <= 0) {
    throw std::invalid_argument("ConnectionPool needs at least one connection.");
  }
  idle_.reserve(static_cast<size_t>(pool_size));
  for (int i = 0; i < pool_size; ++i) {
    idle_.push_back(open(db_path_, options));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::open(const std::string& db_path,
                                                        const ConnectionOptions& options) {
  auto db = std::make_unique<sqlite::database>(db_path);
  if (options.foreign_keys) {
    *db << "PRAGMA foreign_keys = ON;";
  }
  if (options.wal) {
    *db << "PRAGMA journal_mode = WAL;";
  }
  *db << "PRAGMA busy_timeout = " + std::to_string(options.busy_timeout_ms) + ";";
  return db;
}

std::unique_ptr<sqlite::database> ConnectionPool::take_locked() {
  if (shutting_down_) {
    throw std::runtime_error("Connection pool is shut down");
  }
  std::unique_ptr<sqlite::database> conn = std::move(idle_.back());
  idle_.pop_back();
  return conn;
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return shutting_down_ || !idle_.empty(); });
  return take_locked();
}

std::unique_ptr<sqlite::database> ConnectionPool::try_get_connection(
    std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mtx_);
  if (!cv_.wait_for(lock, timeout, [this] { return shutting_down_ || !idle_.empty(); })) {
    return nullptr;
  }
  return take_locked();
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (shutting_down_ || !conn) {
      return;
    }
    idle_.push_back(std::move(conn));
  }
  cv_.notify_one();
}

size_t ConnectionPool::available() {
  std::lock_guard<std::mutex> lock(mtx_);
  return idle_.size();
}

void ConnectionPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    shutting_down_ = true;
    idle_.clear();
  }
  cv_.notify_all();
}

}  // namespace finmda_core

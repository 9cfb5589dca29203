#pragma once
#include <sqlite_modern_cpp.h>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace finmda_core {

struct ConnectionOptions {
    int busy_timeout_ms = 5000;
    bool foreign_keys = true;
    bool wal = true;
};

/**
 * Fixed set of sqlite connections to one database file, shared by the
 * worker threads and the CLI. Borrowers block until a connection is free.
 */
class ConnectionPool {
public:
    ConnectionPool(const std::string& db_path, int pool_size, ConnectionOptions options = {});

    // Opens a single connection with the pool's pragmas applied.
    static std::unique_ptr<sqlite::database> open(const std::string& db_path,
                                                  const ConnectionOptions& options);

    // Blocks until a connection is free. Throws once the pool is shut down.
    std::unique_ptr<sqlite::database> get_connection();

    // Like get_connection(), but gives up after timeout and returns nullptr.
    std::unique_ptr<sqlite::database> try_get_connection(std::chrono::milliseconds timeout);

    void return_connection(std::unique_ptr<sqlite::database> conn);
    void shutdown();

    size_t available();
    int size() const { return pool_size_; }

private:
    std::unique_ptr<sqlite::database> take_locked();

    std::string db_path_;
    int pool_size_;
    bool shutting_down_ = false;
    std::vector<std::unique_ptr<sqlite::database>> idle_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace finmda_core

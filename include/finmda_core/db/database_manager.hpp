#pragma once

#include "finmda_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace finmda_core {

/**
 * Owns the schema and the connection pool of one index database file.
 * Constructed once at startup and handed to the stores that need it.
 */
class DatabaseManager {
public:
    static constexpr int kSchemaVersion = 1;

    DatabaseManager(const std::filesystem::path& db_path,
                    int pool_size,
                    ConnectionOptions options = {});
    ~DatabaseManager();

    // Used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();
    bool is_open() const { return pool_ != nullptr; }

    const std::filesystem::path& db_path() const { return db_path_; }
    int schema_version();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    void migrate(sqlite::database& db);

    std::filesystem::path db_path_;
    std::unique_ptr<ConnectionPool> pool_;
};

} // namespace finmda_core

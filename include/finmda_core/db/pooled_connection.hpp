#pragma once
#include "finmda_core/db/database_manager.hpp"
#include <sqlite_modern_cpp.h>
#include <memory>

namespace finmda_core {

// Borrows a connection for the lifetime of the guard.
class PooledConnection {
public:
    explicit PooledConnection(DatabaseManager& manager)
        : manager_(&manager), conn_(manager.get_connection()) {}

    PooledConnection(PooledConnection&& other) noexcept
        : manager_(other.manager_), conn_(std::move(other.conn_)) {}

    ~PooledConnection() {
        if (conn_) {
            manager_->return_connection(std::move(conn_));
        }
    }

    sqlite::database* operator->() const { return conn_.get(); }
    sqlite::database& operator*() const { return *conn_; }

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;
    PooledConnection& operator=(PooledConnection&&) = delete;

private:
    DatabaseManager* manager_;
    std::unique_ptr<sqlite::database> conn_;
};

}  // namespace finmda_core

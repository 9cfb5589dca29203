#pragma once

#include <sqlite_modern_cpp.h>

namespace finmda_core {

enum class TransactionMode { Deferred, Immediate };

// Scoped BEGIN/COMMIT; rolls back on scope exit unless committed.
// Immediate mode takes the write lock at BEGIN.
class Transaction {
 public:
  explicit Transaction(sqlite::database& db, TransactionMode mode = TransactionMode::Deferred)
      : db_(db) {
    db_ << (mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
    open_ = true;
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (!open_) {
      return;
    }
    db_ << "COMMIT;";
    open_ = false;
  }

  void rollback() {
    if (!open_) {
      return;
    }
    open_ = false;
    db_ << "ROLLBACK;";
  }

  bool is_open() const {
    return open_;
  }

  ~Transaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      rollback();
    } catch (const sqlite::sqlite_exception&) {
      // sqlite already ended the transaction on the failing statement
    }
  }

 private:
  sqlite::database& db_;
  bool open_ = false;
};

}  // namespace finmda_core

#pragma once

#include <string>
#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

namespace finmda_core {

enum class DbErrorKind { BusyOrLocked, Constraint, Readonly, Io, CantOpen, Full, Schema, Generic };

struct DbFailure {
  DbErrorKind kind = DbErrorKind::Generic;
  int code = 0;
  int extended_code = 0;
  bool retryable = false;  // busy/locked and io clear up on their own
};

namespace detail {
struct DbErrorName {
  int primary_code;
  DbErrorKind kind;
  const char* name;
};

inline constexpr DbErrorName kDbErrorNames[] = {
    {SQLITE_BUSY, DbErrorKind::BusyOrLocked, "busy_or_locked"},
    {SQLITE_LOCKED, DbErrorKind::BusyOrLocked, "busy_or_locked"},
    {SQLITE_CONSTRAINT, DbErrorKind::Constraint, "constraint"},
    {SQLITE_READONLY, DbErrorKind::Readonly, "readonly"},
    {SQLITE_IOERR, DbErrorKind::Io, "io"},
    {SQLITE_CANTOPEN, DbErrorKind::CantOpen, "cantopen"},
    {SQLITE_FULL, DbErrorKind::Full, "full"},
    {SQLITE_ERROR, DbErrorKind::Schema, "schema"},
    {SQLITE_SCHEMA, DbErrorKind::Schema, "schema"},
};
}  // namespace detail

inline DbFailure inspect_db_error(const sqlite::sqlite_exception& e) {
  DbFailure failure;
  failure.code = e.get_code();
  failure.extended_code = e.get_extended_code();
  for (const auto& entry : detail::kDbErrorNames) {
    if (entry.primary_code == failure.code) {
      failure.kind = entry.kind;
      break;
    }
  }
  failure.retryable =
      failure.kind == DbErrorKind::BusyOrLocked || failure.kind == DbErrorKind::Io;
  return failure;
}

inline const char* db_error_kind_name(DbErrorKind kind) {
  for (const auto& entry : detail::kDbErrorNames) {
    if (entry.kind == kind) {
      return entry.name;
    }
  }
  return "generic";
}

// "<operation> failed: (<kind>) <sqlite message> [code=.., xcode=..]"
inline std::string format_db_error(const std::string& operation, const sqlite::sqlite_exception& e) {
  const DbFailure failure = inspect_db_error(e);
  std::string msg = operation + " failed: (" + db_error_kind_name(failure.kind) + ") " + e.what();
  msg += " [code=" + std::to_string(failure.code) +
         ", xcode=" + std::to_string(failure.extended_code) + "]";
  if (failure.retryable) {
    msg += " (retryable)";
  }
  return msg;
}

}  // namespace finmda_core

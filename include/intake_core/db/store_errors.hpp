#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace intake_core {

// Coarse grouping of SQLite failures as the log store reports them
enum class StoreErrorKind {
  Contention,  // busy or locked; another writer held the database
  Storage,     // the log directory is unusable: io, full, readonly, cannot open
  Integrity,   // constraint violation or a damaged database file
  Statement,   // bad SQL or a schema mismatch
  Other
};

inline StoreErrorKind classify_store_error(int result_code) {
  // Extended codes carry the primary code in the low byte
  switch (result_code & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return StoreErrorKind::Contention;
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_READONLY:
    case SQLITE_CANTOPEN:
    case SQLITE_PERM:
      return StoreErrorKind::Storage;
    case SQLITE_CONSTRAINT:
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return StoreErrorKind::Integrity;
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
    case SQLITE_MISMATCH:
    case SQLITE_RANGE:
      return StoreErrorKind::Statement;
    default:
      return StoreErrorKind::Other;
  }
}

inline const char* to_string(StoreErrorKind kind) {
  switch (kind) {
    case StoreErrorKind::Contention:
      return "contention";
    case StoreErrorKind::Storage:
      return "storage";
    case StoreErrorKind::Integrity:
      return "integrity";
    case StoreErrorKind::Statement:
      return "statement";
    default:
      return "other";
  }
}

// e.g. "record_file_outcome failed (storage): disk I/O error [sqlite 10/522]"
inline std::string describe_store_error(const std::string& operation,
                                        const sqlite::sqlite_exception& e) {
  const StoreErrorKind kind = classify_store_error(e.get_code());
  std::string message = operation + " failed (" + to_string(kind) + "): " + e.errstr();
  message += " [sqlite " + std::to_string(e.get_code()) + "/" +
             std::to_string(e.get_extended_code()) + "]";
  if (!e.get_sql().empty()) {
    message += " while running: " + e.get_sql();
  }
  return message;
}

}  // namespace intake_core

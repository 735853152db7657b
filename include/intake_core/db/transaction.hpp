#pragma once

#include <sqlite_modern_cpp.h>

namespace intake_core {

// Scoped BEGIN/COMMIT on one connection. Leaving the scope without commit()
// rolls back.
class Transaction {
 public:
  enum class Mode { Deferred, Immediate };

  // Immediate takes the write lock at BEGIN rather than at the first write
  explicit Transaction(sqlite::database& db, Mode mode = Mode::Deferred) : db_(db) {
    db_ << (mode == Mode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
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

  ~Transaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception&) {
      // SQLite already rolled back on its own (SQLITE_FULL, SQLITE_IOERR)
    }
  }

 private:
  sqlite::database& db_;
  bool open_ = false;
};

}  // namespace intake_core

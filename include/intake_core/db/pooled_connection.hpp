#pragma once

#include <memory>
#include <sqlite_modern_cpp.h>

#include "intake_core/db/database_manager.hpp"

namespace intake_core {

// Holds one pooled connection for the lifetime of the guard. Throws whatever
// DatabaseManager::get_connection throws when none can be handed out.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager& manager)
      : manager_(manager), conn_(manager.get_connection()) {}

  ~PooledConnection() {
    if (conn_) {
      manager_.return_connection(std::move(conn_));
    }
  }

  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;

  sqlite::database& operator*() const { return *conn_; }
  sqlite::database* operator->() const { return conn_.get(); }

 private:
  DatabaseManager& manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace intake_core

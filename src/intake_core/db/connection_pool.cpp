#include "intake_core/db/connection_pool.hpp"
#include <stdexcept>

namespace intake_core {

ConnectionPool::ConnectionPool(const std::filesystem::path& db_path, int pool_size) {
  idle_.reserve(static_cast<std::size_t>(pool_size));
  for (int i = 0; i < pool_size; ++i) {
    idle_.push_back(open_connection(db_path));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::open_connection(
    const std::filesystem::path& db_path) {
  auto db = std::make_unique<sqlite::database>(db_path.string());
  *db << "PRAGMA journal_mode = WAL;";
  // API readers overlap a run's writes; wait for the lock instead of failing with SQLITE_BUSY
  *db << "PRAGMA busy_timeout = 5000;";
  *db << "PRAGMA synchronous = NORMAL;";
  return db;
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  returned_.wait(lock, [this] { return closed_ || !idle_.empty(); });

  if (closed_) {
    throw std::runtime_error("Connection pool is shut down");
  }

  std::unique_ptr<sqlite::database> conn = std::move(idle_.back());
  idle_.pop_back();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_ || !conn) {
      return;
    }
    idle_.push_back(std::move(conn));
  }
  returned_.notify_one();
}

void ConnectionPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
    idle_.clear();
  }
  returned_.notify_all();
}

std::size_t ConnectionPool::idle_count() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return idle_.size();
}

}  // namespace intake_core

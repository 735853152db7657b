#include "intake_core/db/database_manager.hpp"

#include <stdexcept>

namespace intake_core {

namespace {

constexpr int kSchemaVersion = 1;

// Append-only event log; id order is history order
constexpr const char* kCreateHistory = R"(
    CREATE TABLE IF NOT EXISTS ingestion_history (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        session_id TEXT NOT NULL,
        timestamp TEXT NOT NULL,
        event TEXT NOT NULL,
        entry_json TEXT NOT NULL
    )
  )";

constexpr const char* kCreateHistoryIndex = R"(
    CREATE INDEX IF NOT EXISTS idx_ingestion_history_session
    ON ingestion_history(session_id)
  )";

// Last successful extraction per path
constexpr const char* kCreateMetadata = R"(
    CREATE TABLE IF NOT EXISTS file_metadata (
        path TEXT PRIMARY KEY,
        checksum TEXT,
        extracted_at TEXT NOT NULL,
        record_json TEXT NOT NULL
    )
  )";

}  // namespace

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::initialize(const std::filesystem::path& db_path, int pool_size) {
  if (is_initialized_) {
    return;
  }
  if (pool_size <= 0) {
    throw std::invalid_argument("pool_size must be greater than 0");
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // Schema goes in over a private handle so every pooled connection sees the tables
  setup_schema(db_path);
  pool_ = std::make_unique<ConnectionPool>(db_path, pool_size);

  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has not been initialized.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

std::size_t DatabaseManager::idle_connections() const {
  return is_initialized_ ? pool_->idle_count() : 0;
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path) {
  sqlite::database db(db_path.string());
  db << "PRAGMA journal_mode = WAL;";

  int version = 0;
  db << "PRAGMA user_version;" >> version;
  if (version > kSchemaVersion) {
    throw std::runtime_error("Ingestion database " + db_path.string() + " has schema version " +
                             std::to_string(version) + "; this build understands up to " +
                             std::to_string(kSchemaVersion));
  }

  db << "BEGIN;";
  try {
    db << kCreateHistory;
    db << kCreateHistoryIndex;
    db << kCreateMetadata;
    db << "PRAGMA user_version = " + std::to_string(kSchemaVersion) + ";";
    db << "COMMIT;";
  } catch (const sqlite::sqlite_exception&) {
    db << "ROLLBACK;";
    throw;
  }
}

}  // namespace intake_core

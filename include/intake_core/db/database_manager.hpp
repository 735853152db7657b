#pragma once

#include "intake_core/db/connection_pool.hpp"
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace intake_core {

// Owns the schema and the pool for one ingestion database. Constructed once at
// process start and handed to the stores that need it.
class DatabaseManager {
public:
    DatabaseManager() = default;
    ~DatabaseManager();

    // Creates the parent directory and the schema, then opens pool_size
    // connections. Throws std::invalid_argument for pool_size <= 0 and
    // std::runtime_error for a database written by a newer schema.
    void initialize(const std::filesystem::path& db_path, int pool_size);

    // These methods are used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();

    bool is_initialized() const { return is_initialized_; }
    std::size_t idle_connections() const;

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    void setup_schema(const std::filesystem::path& db_path);

    std::unique_ptr<ConnectionPool> pool_;
    bool is_initialized_ = false;
};

} // namespace intake_core

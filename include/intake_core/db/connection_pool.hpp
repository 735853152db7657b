#pragma once
#include <sqlite_modern_cpp.h>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

namespace intake_core {

// Fixed set of open handles to one ingestion database. Borrowers block while
// every handle is out; after shutdown() borrowing throws and returned handles
// are closed instead of kept.
class ConnectionPool {
public:
    ConnectionPool(const std::filesystem::path& db_path, int pool_size);

    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);
    void shutdown();

    std::size_t idle_count() const;

private:
    static std::unique_ptr<sqlite::database> open_connection(const std::filesystem::path& db_path);

    bool closed_ = false;
    std::vector<std::unique_ptr<sqlite::database>> idle_;
    mutable std::mutex mtx_;
    std::condition_variable returned_;
};

} // namespace intake_core

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <sqlite_modern_cpp.h>
#include <string>
#include <vector>

#include "intake_core/db/database_manager.hpp"
#include "intake_core/logging/logger_factory.hpp"
#include "intake_core/types/ingestion_event.hpp"
#include "intake_core/types/metadata_record.hpp"

namespace intake_core {

class LogStoreError : public std::exception {
 public:
  explicit LogStoreError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Append-only ingestion history plus the path-keyed table of the last
// successful extraction per file. Writes return false instead of throwing;
// the failure is logged.
class IngestionLogStore {
 public:
  // Throws LogStoreError when db_manager has not been initialized
  IngestionLogStore(DatabaseManager& db_manager, LoggerPtr logger);
  virtual ~IngestionLogStore() = default;

  IngestionLogStore(const IngestionLogStore&) = delete;
  IngestionLogStore& operator=(const IngestionLogStore&) = delete;

  virtual bool record_start(const std::string& session_id, std::int64_t files_detected);

  // The metadata upsert happens only when success is true, in the same
  // transaction as the history row
  virtual bool record_file_outcome(const std::string& session_id,
                                   const std::string& file_path,
                                   const FileMetadataRecord& metadata,
                                   bool success);

  virtual bool record_complete(const std::string& session_id,
                               std::int64_t processed_count,
                               std::int64_t failed_count);

  // Last `limit` entries in append order; nullopt or 0 returns everything
  std::vector<IngestionHistoryEntry> get_history(std::optional<std::size_t> limit = std::nullopt) const;

  std::optional<FileMetadataRecord> get_metadata(const std::string& file_path) const;
  std::map<std::string, FileMetadataRecord> get_all_metadata() const;

 private:
  bool append(const IngestionHistoryEntry& entry);
  void insert_history_row(sqlite::database& db, const IngestionHistoryEntry& entry) const;
  void upsert_metadata_row(sqlite::database& db,
                           const std::string& file_path,
                           const FileMetadataRecord& metadata) const;

  DatabaseManager& db_manager_;
  LoggerPtr logger_;
  // Serializes every write; readers go through their own pooled connection
  std::mutex write_mutex_;
};

}  // namespace intake_core

#include "intake_core/db/ingestion_log_store.hpp"

#include <chrono>
#include <exception>

#include "intake_core/db/pooled_connection.hpp"
#include "intake_core/db/store_errors.hpp"
#include "intake_core/db/transaction.hpp"
#include "intake_core/utils/time_utils.hpp"

namespace intake_core {

IngestionLogStore::IngestionLogStore(DatabaseManager& db_manager, LoggerPtr logger)
    : db_manager_(db_manager), logger_(std::move(logger)) {
  if (!db_manager_.is_initialized()) {
    throw LogStoreError("Ingestion database must be initialized before the log store is created");
  }
}

bool IngestionLogStore::record_start(const std::string& session_id, std::int64_t files_detected) {
  IngestionHistoryEntry entry;
  entry.session_id = session_id;
  entry.timestamp = std::chrono::system_clock::now();
  entry.event = IngestionEvent::Start;
  entry.files_detected = files_detected;
  return append(entry);
}

bool IngestionLogStore::record_complete(const std::string& session_id,
                                        std::int64_t processed_count,
                                        std::int64_t failed_count) {
  IngestionHistoryEntry entry;
  entry.session_id = session_id;
  entry.timestamp = std::chrono::system_clock::now();
  entry.event = IngestionEvent::Complete;
  entry.processed_count = processed_count;
  entry.failed_count = failed_count;
  return append(entry);
}

bool IngestionLogStore::record_file_outcome(const std::string& session_id,
                                            const std::string& file_path,
                                            const FileMetadataRecord& metadata,
                                            bool success) {
  IngestionHistoryEntry entry;
  entry.session_id = session_id;
  entry.timestamp = std::chrono::system_clock::now();
  entry.event = IngestionEvent::FileProcessed;
  entry.file_path = file_path;
  entry.success = success;
  entry.metadata = metadata;

  std::lock_guard<std::mutex> lock(write_mutex_);
  try {
    PooledConnection db(db_manager_);
    Transaction tx(*db, Transaction::Mode::Immediate);
    insert_history_row(*db, entry);
    if (success) {
      upsert_metadata_row(*db, file_path, metadata);
    }
    tx.commit();
    return true;
  } catch (const sqlite::sqlite_exception& e) {
    logger_->error("Error logging file processing for {}: {}", file_path,
                   describe_store_error("record_file_outcome", e));
  } catch (const std::exception& e) {
    logger_->error("Error logging file processing for {}: {}", file_path, e.what());
  }
  return false;
}

bool IngestionLogStore::append(const IngestionHistoryEntry& entry) {
  const std::string event_name = to_string(entry.event);
  std::lock_guard<std::mutex> lock(write_mutex_);
  try {
    PooledConnection db(db_manager_);
    insert_history_row(*db, entry);
    return true;
  } catch (const sqlite::sqlite_exception& e) {
    logger_->error("Error logging {} event for session {}: {}", event_name, entry.session_id,
                   describe_store_error("append_history", e));
  } catch (const std::exception& e) {
    logger_->error("Error logging {} event for session {}: {}", event_name, entry.session_id,
                   e.what());
  }
  return false;
}

void IngestionLogStore::insert_history_row(sqlite::database& db,
                                           const IngestionHistoryEntry& entry) const {
  const nlohmann::json doc = entry;
  db << "INSERT INTO ingestion_history (session_id, timestamp, event, entry_json) "
        "VALUES (?, ?, ?, ?)"
     << entry.session_id << time_point_to_string(entry.timestamp) << to_string(entry.event)
     << doc.dump();
}

void IngestionLogStore::upsert_metadata_row(sqlite::database& db,
                                            const std::string& file_path,
                                            const FileMetadataRecord& metadata) const {
  const nlohmann::json doc = metadata;
  db << "REPLACE INTO file_metadata (path, checksum, extracted_at, record_json) "
        "VALUES (?, ?, ?, ?)"
     << file_path << metadata.checksum.value_or("")
     << time_point_to_string(metadata.extraction_time) << doc.dump();
}

std::vector<IngestionHistoryEntry> IngestionLogStore::get_history(
    std::optional<std::size_t> limit) const {
  std::vector<IngestionHistoryEntry> entries;
  auto collect = [&](std::int64_t id, std::string entry_json) {
    try {
      entries.push_back(nlohmann::json::parse(entry_json).get<IngestionHistoryEntry>());
    } catch (const std::exception& e) {
      logger_->warn("Skipping malformed history entry {}: {}", id, e.what());
    }
  };

  try {
    PooledConnection db(db_manager_);
    if (limit.has_value() && *limit > 0) {
      // Newest N, handed back oldest first
      *db << "SELECT id, entry_json FROM ("
             "  SELECT id, entry_json FROM ingestion_history ORDER BY id DESC LIMIT ?"
             ") ORDER BY id ASC"
          << static_cast<std::int64_t>(*limit) >>
          collect;
    } else {
      *db << "SELECT id, entry_json FROM ingestion_history ORDER BY id ASC" >> collect;
    }
  } catch (const sqlite::sqlite_exception& e) {
    logger_->error("Error reading ingestion history: {}", describe_store_error("get_history", e));
  } catch (const std::exception& e) {
    logger_->error("Error reading ingestion history: {}", e.what());
  }
  return entries;
}

std::optional<FileMetadataRecord> IngestionLogStore::get_metadata(
    const std::string& file_path) const {
  std::optional<FileMetadataRecord> record;
  try {
    PooledConnection db(db_manager_);
    *db << "SELECT record_json FROM file_metadata WHERE path = ?" << file_path >>
        [&](std::string record_json) {
          try {
            record = nlohmann::json::parse(record_json).get<FileMetadataRecord>();
          } catch (const std::exception& e) {
            logger_->warn("Skipping malformed metadata for {}: {}", file_path, e.what());
          }
        };
  } catch (const sqlite::sqlite_exception& e) {
    logger_->error("Error reading metadata for {}: {}", file_path,
                   describe_store_error("get_metadata", e));
  } catch (const std::exception& e) {
    logger_->error("Error reading metadata for {}: {}", file_path, e.what());
  }
  return record;
}

std::map<std::string, FileMetadataRecord> IngestionLogStore::get_all_metadata() const {
  std::map<std::string, FileMetadataRecord> table;
  try {
    PooledConnection db(db_manager_);
    *db << "SELECT path, record_json FROM file_metadata ORDER BY path" >>
        [&](std::string path, std::string record_json) {
          try {
            table.emplace(path, nlohmann::json::parse(record_json).get<FileMetadataRecord>());
          } catch (const std::exception& e) {
            logger_->warn("Skipping malformed metadata for {}: {}", path, e.what());
          }
        };
  } catch (const sqlite::sqlite_exception& e) {
    logger_->error("Error reading metadata table: {}", describe_store_error("get_all_metadata", e));
  } catch (const std::exception& e) {
    logger_->error("Error reading metadata table: {}", e.what());
  }
  return table;
}

}  // namespace intake_core

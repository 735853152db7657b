#include "intake_core/types/ingestion_event.hpp"

#include <stdexcept>

namespace intake_core {

std::string to_string(IngestionEvent event) {
  switch (event) {
    case IngestionEvent::Start:
      return "ingestion_start";
    case IngestionEvent::FileProcessed:
      return "file_processed";
    case IngestionEvent::Complete:
      return "ingestion_complete";
    default:
      return "unknown";
  }
}

IngestionEvent ingestion_event_from_string(const std::string& str) {
  if (str == "ingestion_start")
    return IngestionEvent::Start;
  if (str == "file_processed")
    return IngestionEvent::FileProcessed;
  if (str == "ingestion_complete")
    return IngestionEvent::Complete;
  throw std::invalid_argument("Unknown IngestionEvent: " + str);
}

void to_json(nlohmann::json& j, const IngestionHistoryEntry& entry) {
  j = nlohmann::json{{"session_id", entry.session_id},
                     {"timestamp", time_point_to_string(entry.timestamp)},
                     {"event", to_string(entry.event)}};
  switch (entry.event) {
    case IngestionEvent::Start:
      j["files_detected"] = entry.files_detected;
      break;
    case IngestionEvent::FileProcessed:
      j["file_path"] = entry.file_path;
      j["success"] = entry.success;
      j["metadata"] = entry.metadata;
      break;
    case IngestionEvent::Complete:
      j["processed_count"] = entry.processed_count;
      j["failed_count"] = entry.failed_count;
      break;
  }
}

void from_json(const nlohmann::json& j, IngestionHistoryEntry& entry) {
  entry = IngestionHistoryEntry{};
  entry.session_id = j.at("session_id").get<std::string>();
  entry.timestamp = string_to_time_point(j.at("timestamp").get<std::string>());
  entry.event = ingestion_event_from_string(j.at("event").get<std::string>());
  entry.files_detected = j.value("files_detected", std::int64_t{0});
  entry.file_path = j.value("file_path", std::string{});
  entry.success = j.value("success", false);
  entry.metadata = j.value("metadata", nlohmann::json{});
  entry.processed_count = j.value("processed_count", std::int64_t{0});
  entry.failed_count = j.value("failed_count", std::int64_t{0});
}

}  // namespace intake_core

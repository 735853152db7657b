#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "intake_core/utils/time_utils.hpp"

namespace intake_core {

enum class IngestionEvent { Start, FileProcessed, Complete };

std::string to_string(IngestionEvent event);
IngestionEvent ingestion_event_from_string(const std::string& str);

// One immutable event in the append-only history
struct IngestionHistoryEntry {
  std::string session_id;
  TimePoint timestamp{};
  IngestionEvent event = IngestionEvent::Start;

  // Start
  std::int64_t files_detected = 0;

  // FileProcessed
  std::string file_path;
  bool success = false;
  nlohmann::json metadata;

  // Complete
  std::int64_t processed_count = 0;
  std::int64_t failed_count = 0;
};

void to_json(nlohmann::json& j, const IngestionHistoryEntry& entry);
void from_json(const nlohmann::json& j, IngestionHistoryEntry& entry);

}  // namespace intake_core

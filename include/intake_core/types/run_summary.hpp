#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "intake_core/types/metadata_record.hpp"

namespace intake_core {

struct FileResult {
  std::string file_path;
  bool success = false;
  std::optional<FileMetadataRecord> metadata;
  // Set when the failure escaped extraction and no record exists
  std::optional<std::string> error;
};

// Returned to the caller of a run; never persisted on its own
struct IngestionRunSummary {
  std::string session_id;
  std::int64_t total_files = 0;
  std::int64_t processed_count = 0;
  std::int64_t failed_count = 0;
  std::vector<FileResult> results;
  std::optional<std::string> error;

  static IngestionRunSummary aborted(const std::string& session_id, const std::string& message) {
    IngestionRunSummary summary;
    summary.session_id = session_id;
    summary.error = message;
    return summary;
  }
};

void to_json(nlohmann::json& j, const FileResult& result);
void to_json(nlohmann::json& j, const IngestionRunSummary& summary);

}  // namespace intake_core

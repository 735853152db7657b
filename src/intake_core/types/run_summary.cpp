#include "intake_core/types/run_summary.hpp"

namespace intake_core {

void to_json(nlohmann::json& j, const FileResult& result) {
  j = nlohmann::json{{"file_path", result.file_path}, {"success", result.success}};
  if (result.metadata) {
    j["metadata"] = *result.metadata;
  }
  if (result.error) {
    j["error"] = *result.error;
  }
}

void to_json(nlohmann::json& j, const IngestionRunSummary& summary) {
  j = nlohmann::json{{"session_id", summary.session_id},
                     {"total_files", summary.total_files},
                     {"processed_count", summary.processed_count},
                     {"failed_count", summary.failed_count}};
  if (summary.error) {
    j["error"] = *summary.error;
    return;
  }
  j["results"] = summary.results;
}

}  // namespace intake_core

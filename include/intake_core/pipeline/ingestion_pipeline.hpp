#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "intake_core/db/ingestion_log_store.hpp"
#include "intake_core/detection/file_detector.hpp"
#include "intake_core/logging/logger_factory.hpp"
#include "intake_core/services/metadata_extractor.hpp"
#include "intake_core/types/run_summary.hpp"
#include "intake_core/utils/time_utils.hpp"

namespace intake_core {

struct PipelineOptions {
  // 1 keeps extraction strictly sequential
  int extraction_workers = 1;
};

// Detect, extract, record, tally. One run at a time per pipeline.
class IngestionPipeline {
 public:
  IngestionPipeline(std::shared_ptr<FileDetector> detector,
                    std::shared_ptr<MetadataExtractor> extractor,
                    std::shared_ptr<IngestionLogStore> log_store,
                    LoggerPtr logger,
                    PipelineOptions options = {});

  IngestionPipeline(const IngestionPipeline&) = delete;
  IngestionPipeline& operator=(const IngestionPipeline&) = delete;

  // Never throws. A failure outside the per-file loop yields zero counts and
  // an error on the summary.
  IngestionRunSummary run(bool recursive = true);

  // ingestion_YYYYMMDD_HHMMSS_xxxxxx
  static std::string make_session_id(const TimePoint& now);

 private:
  FileResult process_file(const std::string& session_id,
                          const std::filesystem::path& file_path,
                          const std::function<FileMetadataRecord()>& extract);

  std::shared_ptr<FileDetector> detector_;
  std::shared_ptr<MetadataExtractor> extractor_;
  std::shared_ptr<IngestionLogStore> log_store_;
  LoggerPtr logger_;
  PipelineOptions options_;
  std::mutex run_mutex_;
};

}  // namespace intake_core

#include "intake_core/pipeline/ingestion_pipeline.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <future>
#include <random>
#include <vector>

namespace intake_core {

IngestionPipeline::IngestionPipeline(std::shared_ptr<FileDetector> detector,
                                     std::shared_ptr<MetadataExtractor> extractor,
                                     std::shared_ptr<IngestionLogStore> log_store,
                                     LoggerPtr logger,
                                     PipelineOptions options)
    : detector_(std::move(detector)),
      extractor_(std::move(extractor)),
      log_store_(std::move(log_store)),
      logger_(std::move(logger)),
      options_(options) {
  if (options_.extraction_workers < 1) {
    options_.extraction_workers = 1;
  }
}

std::string IngestionPipeline::make_session_id(const TimePoint& now) {
  static std::mutex rng_mutex;
  static std::mt19937 rng{std::random_device{}()};

  std::uint32_t suffix;
  {
    std::lock_guard<std::mutex> lock(rng_mutex);
    suffix = std::uniform_int_distribution<std::uint32_t>(0, 0xFFFFFF)(rng);
  }
  char hex[7];
  std::snprintf(hex, sizeof(hex), "%06x", static_cast<unsigned>(suffix));
  return "ingestion_" + compact_timestamp(now) + "_" + hex;
}

IngestionRunSummary IngestionPipeline::run(bool recursive) {
  std::lock_guard<std::mutex> lock(run_mutex_);
  const std::string session_id = make_session_id(std::chrono::system_clock::now());
  logger_->info("Starting ingestion session: {}", session_id);

  try {
    const std::vector<std::filesystem::path> files = detector_->detect(recursive);
    log_store_->record_start(session_id, static_cast<std::int64_t>(files.size()));

    IngestionRunSummary summary;
    summary.session_id = session_id;
    summary.total_files = static_cast<std::int64_t>(files.size());
    summary.results.reserve(files.size());

    const std::size_t batch_size = static_cast<std::size_t>(options_.extraction_workers);
    for (std::size_t begin = 0; begin < files.size(); begin += batch_size) {
      const std::size_t end = std::min(files.size(), begin + batch_size);

      // Extraction may overlap within a batch; recording stays in detection order
      std::vector<std::future<FileMetadataRecord>> pending;
      if (batch_size > 1) {
        for (std::size_t i = begin; i < end; ++i) {
          pending.push_back(std::async(std::launch::async, &MetadataExtractor::extract,
                                       extractor_.get(), files[i]));
        }
      }

      for (std::size_t i = begin; i < end; ++i) {
        const std::filesystem::path& file_path = files[i];
        FileResult result;
        if (batch_size > 1) {
          std::future<FileMetadataRecord>& future = pending[i - begin];
          result = process_file(session_id, file_path, [&future] { return future.get(); });
        } else {
          result = process_file(session_id, file_path,
                                [this, &file_path] { return extractor_->extract(file_path); });
        }

        if (result.success) {
          ++summary.processed_count;
        } else {
          ++summary.failed_count;
        }
        summary.results.push_back(std::move(result));
      }
    }

    log_store_->record_complete(session_id, summary.processed_count, summary.failed_count);
    logger_->info("Ingestion complete - Processed: {}, Failed: {}", summary.processed_count,
                  summary.failed_count);
    return summary;
  } catch (const std::exception& e) {
    logger_->error("Critical error in ingestion pipeline: {}", e.what());
    return IngestionRunSummary::aborted(session_id, e.what());
  }
}

FileResult IngestionPipeline::process_file(const std::string& session_id,
                                           const std::filesystem::path& file_path,
                                           const std::function<FileMetadataRecord()>& extract) {
  const std::string path_str = file_path.string();
  FileResult result;
  result.file_path = path_str;

  try {
    FileMetadataRecord record = extract();
    result.success = record.succeeded();
    log_store_->record_file_outcome(session_id, path_str, record, result.success);
    if (result.success) {
      logger_->info("Successfully processed: {}", path_str);
    } else {
      logger_->warn("Failed to process: {}", path_str);
    }
    result.metadata = std::move(record);
  } catch (const std::exception& e) {
    result.success = false;
    result.error = "Unexpected error processing " + path_str + ": " + e.what();
    logger_->error("{}", *result.error);
    log_store_->record_file_outcome(session_id, path_str,
                                    FileMetadataRecord::failure(path_str, *result.error), false);
  }
  return result;
}

}  // namespace intake_core

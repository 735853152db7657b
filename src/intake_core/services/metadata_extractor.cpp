#include "intake_core/services/metadata_extractor.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <chrono>
#include <stdexcept>
#include <system_error>

namespace intake_core {

namespace {

TimePoint from_timespec(const struct timespec& ts) {
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
      std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec)));
}

}  // namespace

MetadataExtractor::MetadataExtractor(std::shared_ptr<ExtractorFactory> extractor_factory,
                                     ChecksumCalculator checksum,
                                     LoggerPtr logger)
    : extractor_factory_(std::move(extractor_factory)),
      checksum_(std::move(checksum)),
      logger_(std::move(logger)) {}

FileMetadataRecord MetadataExtractor::extract(const std::filesystem::path& file_path) const {
  try {
    struct stat st {};
    if (::stat(file_path.c_str(), &st) != 0) {
      throw std::system_error(errno, std::generic_category(), "stat " + file_path.string());
    }
    if (!S_ISREG(st.st_mode)) {
      throw std::runtime_error("Not a regular file: " + file_path.string());
    }

    FileMetadataRecord record;
    record.file_path = file_path.string();
    record.file_name = file_path.filename().string();
    record.file_size = static_cast<std::uint64_t>(st.st_size);
    record.file_extension = to_lower(file_path.extension().string());
    // Status-change time stands in for creation time on Linux
    record.created_time = from_timespec(st.st_ctim);
    record.modified_time = from_timespec(st.st_mtim);
    record.checksum = checksum_.file_digest(file_path);
    record.extraction_time = std::chrono::system_clock::now();

    fill_format_details(file_path, record);

    logger_->info("Extracted metadata for: {}", record.file_name);
    return record;
  } catch (const std::exception& e) {
    logger_->error("Failed to extract metadata from {}: {}", file_path.string(), e.what());
    return FileMetadataRecord::failure(file_path.string(), e.what());
  }
}

void MetadataExtractor::fill_format_details(const std::filesystem::path& file_path,
                                            FileMetadataRecord& record) const {
  const FormatExtractor* extractor = extractor_factory_->find_extractor_for(file_path);
  if (!extractor) {
    return;
  }
  try {
    record.details = extractor->extract(file_path);
  } catch (const std::exception& e) {
    logger_->error("Failed to extract {} metadata from {}: {}",
                   to_string(extractor->get_file_format()), file_path.string(), e.what());
    record.format_error_key = extractor->error_key();
    record.format_error = e.what();
  }
}

}  // namespace intake_core

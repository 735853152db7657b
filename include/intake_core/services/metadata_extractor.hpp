#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "intake_core/extractors/checksum.hpp"
#include "intake_core/extractors/extractor_factory.hpp"
#include "intake_core/logging/logger_factory.hpp"
#include "intake_core/types/metadata_record.hpp"

namespace intake_core {

class MetadataExtractor {
 public:
  MetadataExtractor(std::shared_ptr<ExtractorFactory> extractor_factory,
                    ChecksumCalculator checksum,
                    LoggerPtr logger);

  virtual ~MetadataExtractor() = default;

  // Never throws. A stat/read/checksum failure returns a record whose error is
  // set; a failing format branch only fills format_error on an otherwise
  // complete record.
  virtual FileMetadataRecord extract(const std::filesystem::path& file_path) const;

 private:
  void fill_format_details(const std::filesystem::path& file_path,
                           FileMetadataRecord& record) const;

  std::shared_ptr<ExtractorFactory> extractor_factory_;
  ChecksumCalculator checksum_;
  LoggerPtr logger_;
};

}  // namespace intake_core

#pragma once

#include <gmock/gmock.h>

#include <filesystem>
#include <memory>
#include <vector>

#include "intake_core/detection/file_detector.hpp"
#include "intake_core/extractors/extractor_factory.hpp"
#include "intake_core/extractors/format_extractor.hpp"
#include "intake_core/logging/logger_factory.hpp"
#include "intake_core/services/metadata_extractor.hpp"

namespace intake_tests {

/**
 * Mock class for FileDetector to use in tests
 */
class MockFileDetector : public intake_core::FileDetector {
 public:
  MockFileDetector() : intake_core::FileDetector({}, intake_core::make_null_logger()) {}

  MOCK_METHOD(std::vector<std::filesystem::path>, detect, (bool recursive), (const, override));
};

/**
 * Mock class for MetadataExtractor to use in tests
 */
class MockMetadataExtractor : public intake_core::MetadataExtractor {
 public:
  MockMetadataExtractor()
      : intake_core::MetadataExtractor(std::make_shared<intake_core::ExtractorFactory>(),
                                       intake_core::ChecksumCalculator(),
                                       intake_core::make_null_logger()) {}

  MOCK_METHOD(intake_core::FileMetadataRecord, extract,
              (const std::filesystem::path& file_path), (const, override));
};

/**
 * Mock class for a single format branch
 */
class MockFormatExtractor : public intake_core::FormatExtractor {
 public:
  MockFormatExtractor() = default;

  MOCK_METHOD(bool, can_handle, (const std::filesystem::path& file_path), (const, override));
  MOCK_METHOD(intake_core::FormatDetails, extract, (const std::filesystem::path& file_path),
              (const, override));
  MOCK_METHOD(std::string, error_key, (), (const, override));
  MOCK_METHOD(intake_core::FileFormat, get_file_format, (), (const, override));
};

/**
 * Mock class for ExtractorFactory to use in tests
 */
class MockExtractorFactory : public intake_core::ExtractorFactory {
 public:
  MockExtractorFactory() = default;

  MOCK_METHOD(const intake_core::FormatExtractor*, find_extractor_for,
              (const std::filesystem::path& file_path), (const, override));
};

}  // namespace intake_tests

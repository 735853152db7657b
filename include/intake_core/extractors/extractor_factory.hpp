#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "format_extractor.hpp"

/**
 * @class ExtractorFactory
 * @brief Holds every format branch and picks the one for a given file.
 *
 * Selection is by extension. Supported extensions without a branch (plain
 * text) get no extractor at all and keep only their filesystem facts.
 */
namespace intake_core {
class ExtractorFactory {
 public:
  /**
   * @brief Constructs the factory and registers the delimited, spreadsheet,
   * json and parquet branches.
   */
  explicit ExtractorFactory(ExtractorOptions options = {});

  virtual ~ExtractorFactory() = default;

  /**
   * @brief Finds the branch for the given file.
   *
   * @param file_path The path to the file that needs to be described.
   * @return The first registered extractor that can handle the file, or
   *         nullptr when none does.
   */
  virtual const FormatExtractor* find_extractor_for(const std::filesystem::path& file_path) const;

  ExtractorFactory(const ExtractorFactory&) = delete;
  ExtractorFactory& operator=(const ExtractorFactory&) = delete;
  ExtractorFactory(ExtractorFactory&&) = delete;
  ExtractorFactory& operator=(ExtractorFactory&&) = delete;

 private:
  std::vector<FormatExtractorPtr> extractors_;
};
}  // namespace intake_core

#include "intake_core/extractors/extractor_factory.hpp"

#include "intake_core/extractors/delimited_extractor.hpp"
#include "intake_core/extractors/json_extractor.hpp"
#include "intake_core/extractors/parquet_extractor.hpp"
#include "intake_core/extractors/spreadsheet_extractor.hpp"

namespace intake_core {
ExtractorFactory::ExtractorFactory(ExtractorOptions options) {
  extractors_.push_back(std::make_unique<DelimitedExtractor>(options));
  extractors_.push_back(std::make_unique<SpreadsheetExtractor>(options));
  extractors_.push_back(std::make_unique<JsonExtractor>());
  extractors_.push_back(std::make_unique<ParquetExtractor>());
}

const FormatExtractor* ExtractorFactory::find_extractor_for(
    const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors_) {
    if (extractor->can_handle(file_path)) {
      return extractor.get();
    }
  }
  return nullptr;
}
}  // namespace intake_core

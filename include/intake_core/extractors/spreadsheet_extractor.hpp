#pragma once

#include <optional>
#include <string>
#include <vector>

#include "format_extractor.hpp"

namespace intake_core {

// Office Open XML workbooks (.xlsx) through libzip and pugixml, legacy BIFF
// workbooks (.xls) through libxls. Both report every sheet in workbook order.
class SpreadsheetExtractor : public FormatExtractor {
 public:
  explicit SpreadsheetExtractor(ExtractorOptions options = {});

  bool can_handle(const fs::path& file_path) const override;
  FormatDetails extract(const fs::path& file_path) const override;
  std::string error_key() const override {
    return "excel_error";
  }
  FileFormat get_file_format() const override {
    return FileFormat::Spreadsheet;
  }

  // "A" -> 0, "Z" -> 25, "AA" -> 26; reads the letters of a reference like "C7".
  // More than three letters is past the last Excel column and yields nullopt.
  static std::optional<std::size_t> column_index_from_reference(const std::string& reference);

 private:
  ExtractorOptions options_;
};

}  // namespace intake_core

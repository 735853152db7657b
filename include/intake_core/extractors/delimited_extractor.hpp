#pragma once

#include <istream>
#include <vector>

#include "format_extractor.hpp"

namespace intake_core {

// csv and tsv. Column names and types come from a small sample; the row count
// is exact and needs a scan of the whole file.
class DelimitedExtractor : public FormatExtractor {
 public:
  explicit DelimitedExtractor(ExtractorOptions options = {});

  bool can_handle(const fs::path& file_path) const override;
  FormatDetails extract(const fs::path& file_path) const override;
  std::string error_key() const override {
    return "csv_error";
  }
  FileFormat get_file_format() const override {
    return FileFormat::Delimited;
  }

  // Reads one record, honouring quoted fields that span delimiters and line
  // breaks. Returns false at end of input when nothing was read.
  static bool read_record(std::istream& in, char delimiter, std::vector<std::string>& fields);

  // Line separators in the file, plus one for an unterminated last line
  static std::int64_t count_lines(const fs::path& file_path);

 private:
  static char delimiter_for(const fs::path& file_path);

  ExtractorOptions options_;
};

}  // namespace intake_core

#pragma once

#include <filesystem>
#include <initializer_list>
#include <memory>
#include <string>

#include "intake_core/types/file.hpp"
#include "intake_core/types/metadata_record.hpp"

namespace fs = std::filesystem;

namespace intake_core {

class FormatExtractorError : public std::exception {
 public:
  explicit FormatExtractorError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct ExtractorOptions {
  // Rows read after the header to infer column types
  std::size_t sample_rows = 5;
};

// One format branch: reads the structural facts of a single file family
class FormatExtractor {
 public:
  virtual ~FormatExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  // Throws FormatExtractorError (or any std::exception) when the file can't be understood
  virtual FormatDetails extract(const fs::path& file_path) const = 0;

  // Key under which a branch failure is reported in the record, e.g. "csv_error"
  virtual std::string error_key() const = 0;

  virtual FileFormat get_file_format() const = 0;

 protected:
  static bool has_extension(const fs::path& file_path, std::initializer_list<const char*> extensions);
};

using FormatExtractorPtr = std::unique_ptr<FormatExtractor>;

}  // namespace intake_core

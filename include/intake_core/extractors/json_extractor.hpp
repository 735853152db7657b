#pragma once

#include "format_extractor.hpp"

namespace intake_core {

class JsonExtractor : public FormatExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;
  FormatDetails extract(const fs::path& file_path) const override;
  std::string error_key() const override {
    return "json_error";
  }
  FileFormat get_file_format() const override {
    return FileFormat::Json;
  }
};

}  // namespace intake_core

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "format_extractor.hpp"

namespace intake_core {

// Parquet carries its schema and row count in the footer, so no data pages are read
class ParquetExtractor : public FormatExtractor {
 public:
  // One node of the flattened schema tree stored in the footer
  struct SchemaElement {
    std::string name;
    std::optional<std::int32_t> physical_type;
    std::optional<std::int32_t> converted_type;
    // Field id of the LogicalType union member, when present
    std::optional<std::int16_t> logical_type;
    std::optional<std::int8_t> integer_bit_width;
    std::optional<bool> integer_signed;
    std::int32_t num_children = 0;
  };

  struct Footer {
    std::int64_t num_rows = 0;
    std::vector<SchemaElement> schema;
  };

  bool can_handle(const fs::path& file_path) const override;
  FormatDetails extract(const fs::path& file_path) const override;
  std::string error_key() const override {
    return "parquet_error";
  }
  FileFormat get_file_format() const override {
    return FileFormat::Columnar;
  }

  static Footer read_footer(const fs::path& file_path);
  static Footer decode_footer(const std::uint8_t* data, std::size_t size);

  // dtype name a dataframe would give a top-level column of this shape
  static std::string dtype_for(const SchemaElement& element);
};

}  // namespace intake_core

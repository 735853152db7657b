#pragma once

#include <array>
#include <string>

namespace intake_core {

// Structural family a file belongs to, decided by its extension
enum class FileFormat { Delimited, Spreadsheet, Json, Columnar, Text, Unknown };

inline constexpr std::array<const char*, 7> SUPPORTED_EXTENSIONS = {
    ".csv", ".xlsx", ".xls", ".json", ".parquet", ".txt", ".tsv"};

// Conversion utilities
std::string to_string(FileFormat format);

// Lowercases the extension before looking it up; expects the leading dot
FileFormat file_format_from_extension(const std::string& extension);
bool is_supported_extension(const std::string& extension);

std::string to_lower(std::string value);

}  // namespace intake_core

#include "intake_core/types/file.hpp"

#include <algorithm>
#include <cctype>

namespace intake_core {

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string to_string(FileFormat format) {
  switch (format) {
    case FileFormat::Delimited:
      return "Delimited";
    case FileFormat::Spreadsheet:
      return "Spreadsheet";
    case FileFormat::Json:
      return "Json";
    case FileFormat::Columnar:
      return "Columnar";
    case FileFormat::Text:
      return "Text";
    default:
      return "Unknown";
  }
}

FileFormat file_format_from_extension(const std::string& extension) {
  const std::string ext = to_lower(extension);
  if (ext == ".csv" || ext == ".tsv")
    return FileFormat::Delimited;
  if (ext == ".xlsx" || ext == ".xls")
    return FileFormat::Spreadsheet;
  if (ext == ".json")
    return FileFormat::Json;
  if (ext == ".parquet")
    return FileFormat::Columnar;
  if (ext == ".txt")
    return FileFormat::Text;
  return FileFormat::Unknown;
}

bool is_supported_extension(const std::string& extension) {
  const std::string ext = to_lower(extension);
  return std::find(SUPPORTED_EXTENSIONS.begin(), SUPPORTED_EXTENSIONS.end(), ext) !=
         SUPPORTED_EXTENSIONS.end();
}

}  // namespace intake_core

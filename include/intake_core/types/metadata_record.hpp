#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "intake_core/utils/time_utils.hpp"

namespace intake_core {

// Column name -> inferred dtype name, in column order
using ColumnTypes = std::vector<std::pair<std::string, std::string>>;

// csv, tsv, parquet, and each worksheet of a workbook
struct TabularDetails {
  std::int64_t row_count = 0;
  std::int64_t column_count = 0;
  std::vector<std::string> column_names;
  ColumnTypes column_types;
};

struct SpreadsheetDetails {
  std::int64_t sheet_count = 0;
  std::vector<std::string> sheet_names;
  std::map<std::string, TabularDetails> sheets;
};

enum class JsonRootKind { Array, Object, Other };

struct JsonDetails {
  JsonRootKind kind = JsonRootKind::Other;
  std::int64_t record_count = 0;
  // Set only when the first array element is an object
  std::optional<std::vector<std::string>> sample_keys;
  std::vector<std::string> top_level_keys;
  std::string type_name;
};

using FormatDetails = std::variant<std::monostate, TabularDetails, SpreadsheetDetails, JsonDetails>;

struct FileMetadataRecord {
  std::string file_path;
  std::string file_name;
  std::uint64_t file_size = 0;
  std::string file_extension;
  TimePoint created_time{};
  TimePoint modified_time{};
  std::optional<std::string> checksum;
  TimePoint extraction_time{};

  FormatDetails details;

  // Branch-scoped failure, e.g. {"csv_error", "..."}; the record still counts as extracted
  std::optional<std::string> format_error_key;
  std::optional<std::string> format_error;

  // Whole-extraction failure; when set only file_path and extraction_time are meaningful
  std::optional<std::string> error;

  bool succeeded() const {
    return !error.has_value();
  }

  static FileMetadataRecord failure(const std::string& path, const std::string& message);
};

void to_json(nlohmann::json& j, const TabularDetails& details);
void from_json(const nlohmann::json& j, TabularDetails& details);
void to_json(nlohmann::json& j, const FileMetadataRecord& record);
void from_json(const nlohmann::json& j, FileMetadataRecord& record);

}  // namespace intake_core

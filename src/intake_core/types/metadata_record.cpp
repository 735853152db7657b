#include "intake_core/types/metadata_record.hpp"

#include <chrono>

namespace intake_core {

namespace {

nlohmann::json column_types_to_json(const ColumnTypes& types) {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& [name, dtype] : types) {
    out[name] = dtype;
  }
  return out;
}

// Object key order is lost once stored, so column_names drives the order back
ColumnTypes column_types_from_json(const nlohmann::json& j,
                                   const std::vector<std::string>& column_names) {
  ColumnTypes types;
  if (!j.is_object()) {
    return types;
  }
  for (const auto& name : column_names) {
    auto it = j.find(name);
    if (it != j.end() && it->is_string()) {
      types.emplace_back(name, it->get<std::string>());
    }
  }
  return types;
}

const char* json_kind_name(JsonRootKind kind) {
  switch (kind) {
    case JsonRootKind::Array:
      return "array";
    case JsonRootKind::Object:
      return "object";
    default:
      return "other";
  }
}

}  // namespace

FileMetadataRecord FileMetadataRecord::failure(const std::string& path,
                                               const std::string& message) {
  FileMetadataRecord record;
  record.file_path = path;
  record.error = message;
  record.extraction_time = std::chrono::system_clock::now();
  return record;
}

void to_json(nlohmann::json& j, const TabularDetails& details) {
  j = nlohmann::json{{"row_count", details.row_count},
                     {"column_count", details.column_count},
                     {"column_names", details.column_names},
                     {"data_types", column_types_to_json(details.column_types)}};
}

void from_json(const nlohmann::json& j, TabularDetails& details) {
  details.row_count = j.value("row_count", std::int64_t{0});
  details.column_count = j.value("column_count", std::int64_t{0});
  details.column_names = j.value("column_names", std::vector<std::string>{});
  details.column_types =
      column_types_from_json(j.value("data_types", nlohmann::json::object()), details.column_names);
}

void to_json(nlohmann::json& j, const FileMetadataRecord& record) {
  if (record.error) {
    j = nlohmann::json{{"file_path", record.file_path},
                       {"error", *record.error},
                       {"extraction_time", time_point_to_string(record.extraction_time)}};
    return;
  }

  j = nlohmann::json{{"file_path", record.file_path},
                     {"file_name", record.file_name},
                     {"file_size", record.file_size},
                     {"file_extension", record.file_extension},
                     {"created_time", time_point_to_string(record.created_time)},
                     {"modified_time", time_point_to_string(record.modified_time)},
                     {"extraction_time", time_point_to_string(record.extraction_time)}};
  j["checksum"] = record.checksum ? nlohmann::json(*record.checksum) : nlohmann::json(nullptr);

  if (const auto* tabular = std::get_if<TabularDetails>(&record.details)) {
    j.update(nlohmann::json(*tabular));
  } else if (const auto* sheets = std::get_if<SpreadsheetDetails>(&record.details)) {
    nlohmann::json sheets_info = nlohmann::json::object();
    for (const auto& [name, sheet] : sheets->sheets) {
      sheets_info[name] = sheet;
    }
    j["sheet_count"] = sheets->sheet_count;
    j["sheet_names"] = sheets->sheet_names;
    j["sheets_info"] = std::move(sheets_info);
  } else if (const auto* json_details = std::get_if<JsonDetails>(&record.details)) {
    switch (json_details->kind) {
      case JsonRootKind::Array:
        j["json_type"] = json_kind_name(json_details->kind);
        j["record_count"] = json_details->record_count;
        j["sample_keys"] = json_details->sample_keys ? nlohmann::json(*json_details->sample_keys)
                                                     : nlohmann::json(nullptr);
        break;
      case JsonRootKind::Object:
        j["json_type"] = json_kind_name(json_details->kind);
        j["top_level_keys"] = json_details->top_level_keys;
        break;
      case JsonRootKind::Other:
        j["json_type"] = json_details->type_name;
        break;
    }
  }

  if (record.format_error_key && record.format_error) {
    j[*record.format_error_key] = *record.format_error;
  }
}

void from_json(const nlohmann::json& j, FileMetadataRecord& record) {
  record = FileMetadataRecord{};
  record.file_path = j.at("file_path").get<std::string>();
  if (j.contains("extraction_time")) {
    record.extraction_time = string_to_time_point(j.at("extraction_time").get<std::string>());
  }
  if (j.contains("error")) {
    record.error = j.at("error").get<std::string>();
    return;
  }

  record.file_name = j.value("file_name", std::string{});
  record.file_size = j.value("file_size", std::uint64_t{0});
  record.file_extension = j.value("file_extension", std::string{});
  if (j.contains("created_time")) {
    record.created_time = string_to_time_point(j.at("created_time").get<std::string>());
  }
  if (j.contains("modified_time")) {
    record.modified_time = string_to_time_point(j.at("modified_time").get<std::string>());
  }
  if (j.contains("checksum") && j.at("checksum").is_string()) {
    record.checksum = j.at("checksum").get<std::string>();
  }

  if (j.contains("sheet_count")) {
    SpreadsheetDetails sheets;
    sheets.sheet_count = j.at("sheet_count").get<std::int64_t>();
    sheets.sheet_names = j.value("sheet_names", std::vector<std::string>{});
    const auto sheets_info = j.value("sheets_info", nlohmann::json::object());
    for (const auto& [name, sheet] : sheets_info.items()) {
      sheets.sheets[name] = sheet.get<TabularDetails>();
    }
    record.details = std::move(sheets);
  } else if (j.contains("json_type")) {
    JsonDetails details;
    const std::string json_type = j.at("json_type").get<std::string>();
    if (json_type == "array") {
      details.kind = JsonRootKind::Array;
      details.record_count = j.value("record_count", std::int64_t{0});
      if (j.contains("sample_keys") && j.at("sample_keys").is_array()) {
        details.sample_keys = j.at("sample_keys").get<std::vector<std::string>>();
      }
    } else if (json_type == "object") {
      details.kind = JsonRootKind::Object;
      details.top_level_keys = j.value("top_level_keys", std::vector<std::string>{});
    } else {
      details.kind = JsonRootKind::Other;
      details.type_name = json_type;
    }
    record.details = std::move(details);
  } else if (j.contains("row_count")) {
    record.details = j.get<TabularDetails>();
  }

  for (const char* key : {"csv_error", "excel_error", "json_error", "parquet_error"}) {
    if (j.contains(key)) {
      record.format_error_key = key;
      record.format_error = j.at(key).get<std::string>();
      break;
    }
  }
}

}  // namespace intake_core

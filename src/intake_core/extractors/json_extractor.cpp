#include "intake_core/extractors/json_extractor.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

namespace intake_core {

namespace {

// Category names of scalar roots, in the vocabulary callers already know
std::string scalar_type_name(const nlohmann::ordered_json& value) {
  switch (value.type()) {
    case nlohmann::ordered_json::value_t::string:
      return "str";
    case nlohmann::ordered_json::value_t::number_integer:
    case nlohmann::ordered_json::value_t::number_unsigned:
      return "int";
    case nlohmann::ordered_json::value_t::number_float:
      return "float";
    case nlohmann::ordered_json::value_t::boolean:
      return "bool";
    case nlohmann::ordered_json::value_t::null:
      return "NoneType";
    default:
      return value.type_name();
  }
}

std::vector<std::string> keys_of(const nlohmann::ordered_json& object) {
  std::vector<std::string> keys;
  keys.reserve(object.size());
  for (const auto& item : object.items()) {
    keys.push_back(item.key());
  }
  return keys;
}

}  // namespace

bool JsonExtractor::can_handle(const fs::path& file_path) const {
  return has_extension(file_path, {".json"});
}

FormatDetails JsonExtractor::extract(const fs::path& file_path) const {
  std::ifstream file_stream(file_path);
  if (!file_stream.is_open()) {
    throw FormatExtractorError("Could not open file: " + file_path.string());
  }

  // ordered_json keeps keys in document order
  nlohmann::ordered_json data;
  try {
    data = nlohmann::ordered_json::parse(file_stream);
  } catch (const nlohmann::json::parse_error& e) {
    throw FormatExtractorError(e.what());
  }

  JsonDetails details;
  if (data.is_array()) {
    details.kind = JsonRootKind::Array;
    details.record_count = static_cast<std::int64_t>(data.size());
    if (!data.empty() && data.front().is_object()) {
      details.sample_keys = keys_of(data.front());
    }
  } else if (data.is_object()) {
    details.kind = JsonRootKind::Object;
    details.top_level_keys = keys_of(data);
  } else {
    details.kind = JsonRootKind::Other;
    details.type_name = scalar_type_name(data);
  }
  return details;
}

}  // namespace intake_core

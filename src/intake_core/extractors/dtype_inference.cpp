#include "intake_core/extractors/dtype_inference.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace intake_core {

namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

bool is_integer(std::string_view s) {
  std::size_t i = 0;
  if (s[0] == '+' || s[0] == '-') {
    i = 1;
  }
  if (i == s.size()) {
    return false;
  }
  for (; i < s.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
  }
  return true;
}

bool is_float(std::string_view s) {
  const std::string text(s);
  const char* begin = text.c_str();
  char* end = nullptr;
  std::strtod(begin, &end);
  if (end != begin + text.size()) {
    return false;
  }
  // strtod also takes hex floats which a dataframe reader leaves as text
  return text.find("0x") == std::string::npos && text.find("0X") == std::string::npos;
}

}  // namespace

CellKind classify_text_cell(std::string_view cell) {
  const std::string_view value = trim(cell);
  if (value.empty() || value == "NA" || value == "N/A" || value == "NaN" || value == "nan" ||
      value == "null" || value == "NULL" || value == "None") {
    return CellKind::Empty;
  }
  if (value == "True" || value == "TRUE" || value == "true" || value == "False" ||
      value == "FALSE" || value == "false") {
    return CellKind::Boolean;
  }
  if (is_integer(value)) {
    return CellKind::Integer;
  }
  if (is_float(value)) {
    return CellKind::Float;
  }
  return CellKind::Text;
}

std::string infer_dtype(const std::vector<CellKind>& cells) {
  bool any_missing = false;
  bool any_integer = false;
  bool any_float = false;
  bool any_bool = false;
  bool any_text = false;

  for (CellKind kind : cells) {
    switch (kind) {
      case CellKind::Empty:
        any_missing = true;
        break;
      case CellKind::Integer:
        any_integer = true;
        break;
      case CellKind::Float:
        any_float = true;
        break;
      case CellKind::Boolean:
        any_bool = true;
        break;
      case CellKind::Text:
        any_text = true;
        break;
    }
  }

  if (any_text || (any_bool && (any_integer || any_float))) {
    return "object";
  }
  if (any_bool) {
    return any_missing ? "object" : "bool";
  }
  if (any_float || (any_integer && any_missing)) {
    return "float64";
  }
  if (any_integer) {
    return "int64";
  }
  return "float64";
}

}  // namespace intake_core

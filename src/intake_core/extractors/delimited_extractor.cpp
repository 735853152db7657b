#include "intake_core/extractors/delimited_extractor.hpp"

#include <fstream>

#include "intake_core/extractors/dtype_inference.hpp"

namespace intake_core {

DelimitedExtractor::DelimitedExtractor(ExtractorOptions options) : options_(options) {}

bool DelimitedExtractor::can_handle(const fs::path& file_path) const {
  return has_extension(file_path, {".csv", ".tsv"});
}

char DelimitedExtractor::delimiter_for(const fs::path& file_path) {
  return has_extension(file_path, {".tsv"}) ? '\t' : ',';
}

bool DelimitedExtractor::read_record(std::istream& in,
                                     char delimiter,
                                     std::vector<std::string>& fields) {
  fields.clear();
  std::string field;
  bool in_quotes = false;
  bool read_anything = false;
  int ch;

  while ((ch = in.get()) != std::char_traits<char>::eof()) {
    read_anything = true;
    const char c = static_cast<char>(ch);

    if (in_quotes) {
      if (c == '"') {
        if (in.peek() == '"') {
          field.push_back('"');
          in.get();
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }

    if (c == '"') {
      in_quotes = true;
    } else if (c == delimiter) {
      fields.push_back(std::move(field));
      field.clear();
    } else if (c == '\n') {
      if (!field.empty() && field.back() == '\r') {
        field.pop_back();
      }
      fields.push_back(std::move(field));
      return true;
    } else {
      field.push_back(c);
    }
  }

  if (in_quotes) {
    throw FormatExtractorError("Error tokenizing data: EOF inside quoted field");
  }
  if (!read_anything) {
    return false;
  }
  if (!field.empty() && field.back() == '\r') {
    field.pop_back();
  }
  fields.push_back(std::move(field));
  return true;
}

std::int64_t DelimitedExtractor::count_lines(const fs::path& file_path) {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw FormatExtractorError("Could not open file: " + file_path.string());
  }

  std::int64_t lines = 0;
  char last = '\n';
  std::vector<char> buffer(64 * 1024);
  while (file_stream) {
    file_stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize got = file_stream.gcount();
    for (std::streamsize i = 0; i < got; ++i) {
      if (buffer[i] == '\n') {
        ++lines;
      }
    }
    if (got > 0) {
      last = buffer[got - 1];
    }
  }
  if (last != '\n') {
    ++lines;
  }
  return lines;
}

FormatDetails DelimitedExtractor::extract(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw FormatExtractorError("Could not open file: " + file_path.string());
  }
  const char delimiter = delimiter_for(file_path);

  std::vector<std::string> header;
  // Leading blank lines are skipped like any other blank line
  do {
    if (!read_record(file_stream, delimiter, header)) {
      throw FormatExtractorError("No columns to parse from file");
    }
  } while (header.size() == 1 && header[0].empty());

  // UTF-8 byte order mark
  if (header[0].rfind("\xEF\xBB\xBF", 0) == 0) {
    header[0].erase(0, 3);
  }

  TabularDetails details;
  details.column_names = header;
  details.column_count = static_cast<std::int64_t>(header.size());

  std::vector<std::vector<CellKind>> samples(header.size());
  std::vector<std::string> fields;
  std::size_t sampled = 0;
  while (sampled < options_.sample_rows && read_record(file_stream, delimiter, fields)) {
    if (fields.size() == 1 && fields[0].empty()) {
      continue;
    }
    if (fields.size() > header.size()) {
      throw FormatExtractorError("Error tokenizing data: expected " +
                                 std::to_string(header.size()) + " fields, saw " +
                                 std::to_string(fields.size()));
    }
    for (std::size_t col = 0; col < header.size(); ++col) {
      samples[col].push_back(col < fields.size() ? classify_text_cell(fields[col])
                                                 : CellKind::Empty);
    }
    ++sampled;
  }

  for (std::size_t col = 0; col < header.size(); ++col) {
    details.column_types.emplace_back(header[col], infer_dtype(samples[col]));
  }

  // Header line excluded
  details.row_count = count_lines(file_path) - 1;
  return details;
}

}  // namespace intake_core

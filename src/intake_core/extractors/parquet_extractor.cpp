#include "intake_core/extractors/parquet_extractor.hpp"

#include <array>
#include <cstring>
#include <fstream>

#include "intake_core/extractors/thrift_compact_reader.hpp"

namespace intake_core {

namespace {

constexpr std::array<char, 4> MAGIC = {'P', 'A', 'R', '1'};
constexpr std::size_t MAGIC_SIZE = MAGIC.size();
// Footer length (4 bytes, little endian) followed by the trailing magic
constexpr std::size_t TAIL_SIZE = 4 + MAGIC_SIZE;

// parquet.thrift enums
enum PhysicalType : std::int32_t {
  BOOLEAN = 0,
  INT32 = 1,
  INT64 = 2,
  INT96 = 3,
  FLOAT = 4,
  DOUBLE = 5,
  BYTE_ARRAY = 6,
  FIXED_LEN_BYTE_ARRAY = 7,
};

enum ConvertedType : std::int32_t {
  TIMESTAMP_MILLIS = 9,
  TIMESTAMP_MICROS = 10,
  UINT_8 = 11,
  UINT_16 = 12,
  UINT_32 = 13,
  UINT_64 = 14,
  INT_8 = 15,
  INT_16 = 16,
};

// LogicalType union members
constexpr std::int16_t LOGICAL_TIMESTAMP = 8;
constexpr std::int16_t LOGICAL_INTEGER = 10;

// Index columns written by dataframe libraries are not data columns
bool is_index_column(const std::string& name) {
  return name.rfind("__index_level_", 0) == 0;
}

void read_integer_type(ThriftCompactReader& reader, ParquetExtractor::SchemaElement& element) {
  reader.begin_struct();
  while (true) {
    const auto field = reader.read_field_header();
    if (field.type == ThriftCompactReader::Stop) {
      break;
    }
    if (field.id == 1 && field.type == ThriftCompactReader::Byte) {
      element.integer_bit_width = reader.read_i8();
    } else if (field.id == 2 && (field.type == ThriftCompactReader::BoolTrue ||
                                 field.type == ThriftCompactReader::BoolFalse)) {
      element.integer_signed = ThriftCompactReader::bool_from_field(field);
    } else {
      reader.skip(field.type);
    }
  }
  reader.end_struct();
}

void read_logical_type(ThriftCompactReader& reader, ParquetExtractor::SchemaElement& element) {
  reader.begin_struct();
  while (true) {
    const auto field = reader.read_field_header();
    if (field.type == ThriftCompactReader::Stop) {
      break;
    }
    element.logical_type = field.id;
    if (field.id == LOGICAL_INTEGER && field.type == ThriftCompactReader::Struct) {
      read_integer_type(reader, element);
    } else {
      reader.skip(field.type);
    }
  }
  reader.end_struct();
}

ParquetExtractor::SchemaElement read_schema_element(ThriftCompactReader& reader) {
  ParquetExtractor::SchemaElement element;
  reader.begin_struct();
  while (true) {
    const auto field = reader.read_field_header();
    if (field.type == ThriftCompactReader::Stop) {
      break;
    }
    switch (field.id) {
      case 1:
        element.physical_type = reader.read_i32();
        break;
      case 4:
        element.name = reader.read_binary();
        break;
      case 5:
        element.num_children = reader.read_i32();
        break;
      case 6:
        element.converted_type = reader.read_i32();
        break;
      case 10:
        read_logical_type(reader, element);
        break;
      default:
        reader.skip(field.type);
    }
  }
  reader.end_struct();
  return element;
}

// Index just past the subtree rooted at schema[index]
std::size_t skip_subtree(const std::vector<ParquetExtractor::SchemaElement>& schema,
                         std::size_t index) {
  if (index >= schema.size()) {
    throw FormatExtractorError("Corrupt footer: schema tree is truncated");
  }
  const std::int32_t children = schema[index].num_children;
  ++index;
  for (std::int32_t i = 0; i < children; ++i) {
    index = skip_subtree(schema, index);
  }
  return index;
}

}  // namespace

bool ParquetExtractor::can_handle(const fs::path& file_path) const {
  return has_extension(file_path, {".parquet"});
}

ParquetExtractor::Footer ParquetExtractor::decode_footer(const std::uint8_t* data,
                                                         std::size_t size) {
  ThriftCompactReader reader(data, size);
  Footer footer;
  bool saw_schema = false;
  bool saw_rows = false;

  while (true) {
    const auto field = reader.read_field_header();
    if (field.type == ThriftCompactReader::Stop) {
      break;
    }
    if (field.id == 2 && field.type == ThriftCompactReader::List) {
      const auto list = reader.read_list_header();
      footer.schema.reserve(list.size);
      for (std::uint32_t i = 0; i < list.size; ++i) {
        footer.schema.push_back(read_schema_element(reader));
      }
      saw_schema = true;
    } else if (field.id == 3 && field.type == ThriftCompactReader::I64) {
      footer.num_rows = reader.read_i64();
      saw_rows = true;
    } else {
      reader.skip(field.type);
    }
  }

  if (!saw_schema || footer.schema.empty() || !saw_rows) {
    throw FormatExtractorError("Corrupt footer: schema or row count missing");
  }
  return footer;
}

ParquetExtractor::Footer ParquetExtractor::read_footer(const fs::path& file_path) {
  std::ifstream file_stream(file_path, std::ios::binary | std::ios::ate);
  if (!file_stream.is_open()) {
    throw FormatExtractorError("Could not open file: " + file_path.string());
  }
  const auto file_size = static_cast<std::size_t>(file_stream.tellg());
  if (file_size < MAGIC_SIZE + TAIL_SIZE) {
    throw FormatExtractorError("File is too small to be a Parquet file");
  }

  std::array<char, MAGIC_SIZE> head{};
  file_stream.seekg(0);
  file_stream.read(head.data(), head.size());

  std::array<char, TAIL_SIZE> tail{};
  file_stream.seekg(static_cast<std::streamoff>(file_size - TAIL_SIZE));
  file_stream.read(tail.data(), tail.size());
  if (!file_stream) {
    throw FormatExtractorError("Could not read Parquet magic bytes");
  }

  if (std::memcmp(head.data(), MAGIC.data(), MAGIC_SIZE) != 0 ||
      std::memcmp(tail.data() + 4, MAGIC.data(), MAGIC_SIZE) != 0) {
    throw FormatExtractorError("Parquet magic bytes not found in footer. Either the file is "
                               "corrupted or this is not a parquet file.");
  }

  const auto* len_bytes = reinterpret_cast<const unsigned char*>(tail.data());
  const std::uint32_t footer_length = static_cast<std::uint32_t>(len_bytes[0]) |
                                      (static_cast<std::uint32_t>(len_bytes[1]) << 8) |
                                      (static_cast<std::uint32_t>(len_bytes[2]) << 16) |
                                      (static_cast<std::uint32_t>(len_bytes[3]) << 24);
  if (footer_length == 0 || footer_length > file_size - MAGIC_SIZE - TAIL_SIZE) {
    throw FormatExtractorError("Parquet footer length " + std::to_string(footer_length) +
                               " is out of range for a file of " + std::to_string(file_size) +
                               " bytes");
  }

  std::vector<std::uint8_t> footer(footer_length);
  file_stream.seekg(static_cast<std::streamoff>(file_size - TAIL_SIZE - footer_length));
  file_stream.read(reinterpret_cast<char*>(footer.data()), footer_length);
  if (!file_stream) {
    throw FormatExtractorError("Could not read Parquet footer");
  }
  return decode_footer(footer.data(), footer.size());
}

std::string ParquetExtractor::dtype_for(const SchemaElement& element) {
  if (!element.physical_type || element.num_children > 0) {
    // Nested groups (lists, maps, structs) surface as Python objects
    return "object";
  }

  const std::int32_t converted = element.converted_type.value_or(-1);
  switch (*element.physical_type) {
    case BOOLEAN:
      return "bool";
    case INT32:
    case INT64: {
      if (element.logical_type == LOGICAL_TIMESTAMP || converted == TIMESTAMP_MILLIS ||
          converted == TIMESTAMP_MICROS) {
        return "datetime64[ns]";
      }
      int bits = *element.physical_type == INT32 ? 32 : 64;
      bool is_signed = true;
      if (element.integer_bit_width) {
        bits = *element.integer_bit_width;
        is_signed = element.integer_signed.value_or(true);
      } else if (converted == INT_8 || converted == UINT_8) {
        bits = 8;
        is_signed = converted == INT_8;
      } else if (converted == INT_16 || converted == UINT_16) {
        bits = 16;
        is_signed = converted == INT_16;
      } else if (converted == UINT_32 || converted == UINT_64) {
        is_signed = false;
      } else if (element.converted_type || (element.logical_type && element.logical_type != LOGICAL_INTEGER)) {
        // DATE, TIME, DECIMAL and friends
        return "object";
      }
      return (is_signed ? "int" : "uint") + std::to_string(bits);
    }
    case INT96:
      return "datetime64[ns]";
    case FLOAT:
      return "float32";
    case DOUBLE:
      return "float64";
    default:
      return "object";
  }
}

FormatDetails ParquetExtractor::extract(const fs::path& file_path) const {
  const Footer footer = read_footer(file_path);

  TabularDetails details;
  details.row_count = footer.num_rows;

  // schema[0] is the root; its direct children are the columns
  const std::int32_t top_level = footer.schema.front().num_children;
  std::size_t index = 1;
  for (std::int32_t i = 0; i < top_level; ++i) {
    if (index >= footer.schema.size()) {
      throw FormatExtractorError("Corrupt footer: schema tree is truncated");
    }
    const SchemaElement& element = footer.schema[index];
    if (!is_index_column(element.name)) {
      details.column_names.push_back(element.name);
      details.column_types.emplace_back(element.name, dtype_for(element));
    }
    index = skip_subtree(footer.schema, index);
  }
  details.column_count = static_cast<std::int64_t>(details.column_names.size());
  return details;
}

}  // namespace intake_core

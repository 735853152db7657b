#include "intake_core/extractors/thrift_compact_reader.hpp"

#include "intake_core/extractors/format_extractor.hpp"

namespace intake_core {

std::uint8_t ThriftCompactReader::read_byte() {
  if (pos_ >= size_) {
    throw FormatExtractorError("Corrupt footer: unexpected end of metadata");
  }
  return data_[pos_++];
}

std::uint64_t ThriftCompactReader::read_varint() {
  std::uint64_t result = 0;
  int shift = 0;
  while (true) {
    const std::uint8_t byte = read_byte();
    result |= static_cast<std::uint64_t>(byte & 0x7f) << shift;
    if (!(byte & 0x80)) {
      return result;
    }
    shift += 7;
    if (shift > 63) {
      throw FormatExtractorError("Corrupt footer: varint too long");
    }
  }
}

void ThriftCompactReader::begin_struct() {
  if (depth_ + 1 >= MAX_DEPTH) {
    throw FormatExtractorError("Corrupt footer: nesting too deep");
  }
  last_field_id_[++depth_] = 0;
}

void ThriftCompactReader::end_struct() {
  if (depth_ > 0) {
    --depth_;
  }
}

ThriftCompactReader::FieldHeader ThriftCompactReader::read_field_header() {
  const std::uint8_t byte = read_byte();
  FieldHeader header;
  header.type = byte & 0x0f;
  if (header.type == Stop) {
    return header;
  }
  const std::uint8_t delta = byte >> 4;
  if (delta == 0) {
    header.id = static_cast<std::int16_t>(zigzag_decode(read_varint()));
  } else {
    header.id = static_cast<std::int16_t>(last_field_id_[depth_] + delta);
  }
  last_field_id_[depth_] = header.id;
  return header;
}

ThriftCompactReader::ListHeader ThriftCompactReader::read_list_header() {
  const std::uint8_t byte = read_byte();
  ListHeader header;
  header.element_type = byte & 0x0f;
  header.size = byte >> 4;
  if (header.size == 15) {
    header.size = static_cast<std::uint32_t>(read_varint());
  }
  return header;
}

std::int32_t ThriftCompactReader::read_i32() {
  return static_cast<std::int32_t>(zigzag_decode(read_varint()));
}

std::int64_t ThriftCompactReader::read_i64() {
  return zigzag_decode(read_varint());
}

std::string ThriftCompactReader::read_binary() {
  const std::uint64_t length = read_varint();
  if (length > size_ - pos_) {
    throw FormatExtractorError("Corrupt footer: string runs past end of metadata");
  }
  std::string out(reinterpret_cast<const char*>(data_ + pos_), static_cast<std::size_t>(length));
  pos_ += static_cast<std::size_t>(length);
  return out;
}

std::int8_t ThriftCompactReader::read_i8() {
  return static_cast<std::int8_t>(read_byte());
}

void ThriftCompactReader::skip_element(std::uint8_t type) {
  // Container bools take a whole byte instead of riding in a field header
  if (type == BoolTrue || type == BoolFalse) {
    read_byte();
  } else {
    skip(type);
  }
}

void ThriftCompactReader::skip(std::uint8_t type) {
  switch (type) {
    case BoolTrue:
    case BoolFalse:
      // Value lives in the field header; inside a container it is one byte
      break;
    case Byte:
      read_byte();
      break;
    case I16:
    case I32:
    case I64:
      read_varint();
      break;
    case Double:
      for (int i = 0; i < 8; ++i) read_byte();
      break;
    case Binary:
      read_binary();
      break;
    case List:
    case Set: {
      const ListHeader header = read_list_header();
      for (std::uint32_t i = 0; i < header.size; ++i) {
        skip_element(header.element_type);
      }
      break;
    }
    case Map: {
      const std::uint64_t entries = read_varint();
      if (entries == 0) {
        break;
      }
      const std::uint8_t kinds = read_byte();
      for (std::uint64_t i = 0; i < entries; ++i) {
        skip_element(kinds >> 4);
        skip_element(kinds & 0x0f);
      }
      break;
    }
    case Struct:
      begin_struct();
      while (true) {
        const FieldHeader header = read_field_header();
        if (header.type == Stop) {
          break;
        }
        skip(header.type);
      }
      end_struct();
      break;
    default:
      throw FormatExtractorError("Corrupt footer: unknown field type " + std::to_string(type));
  }
}

}  // namespace intake_core

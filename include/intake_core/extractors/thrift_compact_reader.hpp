#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace intake_core {

// Minimal reader for the Thrift compact protocol, enough to walk a Parquet
// footer. Unknown fields are skipped so newer writers stay readable.
class ThriftCompactReader {
 public:
  enum Type : std::uint8_t {
    Stop = 0,
    BoolTrue = 1,
    BoolFalse = 2,
    Byte = 3,
    I16 = 4,
    I32 = 5,
    I64 = 6,
    Double = 7,
    Binary = 8,
    List = 9,
    Set = 10,
    Map = 11,
    Struct = 12,
  };

  struct FieldHeader {
    std::int16_t id = 0;
    std::uint8_t type = Stop;
  };

  struct ListHeader {
    std::uint8_t element_type = Stop;
    std::uint32_t size = 0;
  };

  ThriftCompactReader(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}

  // Call before reading the fields of a nested struct, and end_struct after its Stop
  void begin_struct();
  void end_struct();

  FieldHeader read_field_header();
  ListHeader read_list_header();

  // A bool struct field carries its value in the header type
  static bool bool_from_field(const FieldHeader& header) {
    return header.type == BoolTrue;
  }

  std::int8_t read_i8();
  std::int32_t read_i32();
  std::int64_t read_i64();
  std::string read_binary();

  void skip(std::uint8_t type);

  std::size_t position() const {
    return pos_;
  }

 private:
  std::uint8_t read_byte();
  void skip_element(std::uint8_t type);
  std::uint64_t read_varint();
  static std::int64_t zigzag_decode(std::uint64_t n) {
    return static_cast<std::int64_t>(n >> 1) ^ -static_cast<std::int64_t>(n & 1);
  }

  const std::uint8_t* data_;
  std::size_t size_;
  std::size_t pos_ = 0;

  // Field ids are delta encoded relative to the previous field of the same struct
  static constexpr int MAX_DEPTH = 64;
  std::int16_t last_field_id_[MAX_DEPTH] = {};
  int depth_ = 0;
};

}  // namespace intake_core

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "intake_core/extractors/parquet_extractor.hpp"
#include "intake_core/extractors/thrift_compact_reader.hpp"

namespace intake_core {

namespace {

using T = ThriftCompactReader;

// Encodes just enough of the Thrift compact protocol to build test footers
class CompactWriter {
 public:
  void field(std::int16_t id, std::uint8_t type) {
    const int delta = id - last_.back();
    if (delta > 0 && delta <= 15) {
      byte(static_cast<std::uint8_t>((delta << 4) | type));
    } else {
      byte(type);
      varint(zigzag(id));
    }
    last_.back() = id;
  }
  void begin_struct() { last_.push_back(0); }
  void end_struct() {
    byte(T::Stop);
    last_.pop_back();
  }
  void stop() { byte(T::Stop); }
  void i32(std::int32_t v) { varint(zigzag(v)); }
  void i64(std::int64_t v) { varint(zigzag(v)); }
  void binary(const std::string& s) {
    varint(s.size());
    out_.insert(out_.end(), s.begin(), s.end());
  }
  void list_header(std::uint32_t size, std::uint8_t element_type) {
    if (size < 15) {
      byte(static_cast<std::uint8_t>((size << 4) | element_type));
    } else {
      byte(static_cast<std::uint8_t>(0xF0 | element_type));
      varint(size);
    }
  }
  void byte(std::uint8_t b) { out_.push_back(b); }

  const std::vector<std::uint8_t>& bytes() const { return out_; }

 private:
  static std::uint64_t zigzag(std::int64_t n) {
    return (static_cast<std::uint64_t>(n) << 1) ^ static_cast<std::uint64_t>(n >> 63);
  }
  void varint(std::uint64_t v) {
    while (v >= 0x80) {
      byte(static_cast<std::uint8_t>(v | 0x80));
      v >>= 7;
    }
    byte(static_cast<std::uint8_t>(v));
  }

  std::vector<std::uint8_t> out_;
  std::vector<std::int16_t> last_{0};
};

void leaf(CompactWriter& w, const std::string& name, std::int32_t physical_type) {
  w.begin_struct();
  w.field(1, T::I32);
  w.i32(physical_type);
  w.field(3, T::I32);  // repetition_type, ignored by the reader
  w.i32(1);
  w.field(4, T::Binary);
  w.binary(name);
  w.end_struct();
}

// Footer of a dataframe-style file with seven top-level columns, one of them an index
std::vector<std::uint8_t> sample_footer() {
  CompactWriter w;
  w.field(1, T::I32);  // version
  w.i32(1);

  w.field(2, T::List);
  w.list_header(9, T::Struct);
  // root
  w.begin_struct();
  w.field(4, T::Binary);
  w.binary("schema");
  w.field(5, T::I32);
  w.i32(7);
  w.end_struct();

  leaf(w, "id", 2);      // INT64
  leaf(w, "score", 5);   // DOUBLE
  leaf(w, "flag", 0);    // BOOLEAN

  // INT64 with TIMESTAMP logical type
  w.begin_struct();
  w.field(1, T::I32);
  w.i32(2);
  w.field(4, T::Binary);
  w.binary("ts");
  w.field(10, T::Struct);
  w.begin_struct();
  w.field(8, T::Struct);
  w.begin_struct();
  w.field(1, T::BoolTrue);  // isAdjustedToUTC
  w.field(2, T::Struct);    // unit
  w.begin_struct();
  w.field(2, T::Struct);  // MICROS
  w.begin_struct();
  w.end_struct();
  w.end_struct();
  w.end_struct();
  w.end_struct();
  w.end_struct();

  // INT32 with INTEGER(16, unsigned) logical type
  w.begin_struct();
  w.field(1, T::I32);
  w.i32(1);
  w.field(4, T::Binary);
  w.binary("small");
  w.field(10, T::Struct);
  w.begin_struct();
  w.field(10, T::Struct);
  w.begin_struct();
  w.field(1, T::Byte);
  w.byte(16);
  w.field(2, T::BoolFalse);
  w.end_struct();
  w.end_struct();
  w.end_struct();

  leaf(w, "__index_level_0__", 2);

  // LIST group with one child
  w.begin_struct();
  w.field(4, T::Binary);
  w.binary("tags");
  w.field(5, T::I32);
  w.i32(1);
  w.field(6, T::I32);
  w.i32(3);
  w.end_struct();
  leaf(w, "element", 6);  // BYTE_ARRAY

  w.field(3, T::I64);
  w.i64(42);

  w.field(4, T::List);  // row_groups
  w.list_header(0, T::Struct);

  w.field(5, T::List);  // key_value_metadata
  w.list_header(1, T::Struct);
  w.begin_struct();
  w.field(1, T::Binary);
  w.binary("pandas");
  w.field(2, T::Binary);
  w.binary("{}");
  w.end_struct();

  w.stop();
  return w.bytes();
}

std::string parquet_file(const std::vector<std::uint8_t>& footer) {
  std::string file = "PAR1";
  file.append(16, '\0');  // stand-in for column chunks
  file.append(footer.begin(), footer.end());
  const auto length = static_cast<std::uint32_t>(footer.size());
  for (int shift = 0; shift < 32; shift += 8) {
    file.push_back(static_cast<char>((length >> shift) & 0xFF));
  }
  file += "PAR1";
  return file;
}

}  // namespace

class ParquetExtractorTest : public intake_tests::TempDirTestBase {};

TEST_F(ParquetExtractorTest, ReadsColumnsAndRowCountFromFooter) {
  auto path = write("frame.parquet", parquet_file(sample_footer()));

  ParquetExtractor extractor;
  auto details = std::get<TabularDetails>(extractor.extract(path));

  EXPECT_EQ(details.row_count, 42);
  EXPECT_EQ(details.column_count, 6);
  EXPECT_EQ(details.column_names,
            (std::vector<std::string>{"id", "score", "flag", "ts", "small", "tags"}));
  ASSERT_EQ(details.column_types.size(), 6u);
  EXPECT_EQ(details.column_types[0].second, "int64");
  EXPECT_EQ(details.column_types[1].second, "float64");
  EXPECT_EQ(details.column_types[2].second, "bool");
  EXPECT_EQ(details.column_types[3].second, "datetime64[ns]");
  EXPECT_EQ(details.column_types[4].second, "uint16");
  EXPECT_EQ(details.column_types[5].second, "object");
}

TEST_F(ParquetExtractorTest, DtypeForPhysicalAndConvertedTypes) {
  ParquetExtractor::SchemaElement element;
  element.physical_type = 1;  // INT32
  EXPECT_EQ(ParquetExtractor::dtype_for(element), "int32");

  element.converted_type = 15;  // INT_8
  EXPECT_EQ(ParquetExtractor::dtype_for(element), "int8");

  element.converted_type = 6;  // DATE
  EXPECT_EQ(ParquetExtractor::dtype_for(element), "object");

  element = {};
  element.physical_type = 3;  // INT96
  EXPECT_EQ(ParquetExtractor::dtype_for(element), "datetime64[ns]");

  element.physical_type = 4;  // FLOAT
  EXPECT_EQ(ParquetExtractor::dtype_for(element), "float32");

  element.physical_type = 6;  // BYTE_ARRAY
  EXPECT_EQ(ParquetExtractor::dtype_for(element), "object");
}

TEST_F(ParquetExtractorTest, MissingMagicBytesThrow) {
  auto path = write("not.parquet", std::string(64, 'x'));
  ParquetExtractor extractor;
  try {
    extractor.extract(path);
    FAIL() << "Expected FormatExtractorError";
  } catch (const FormatExtractorError& e) {
    EXPECT_NE(std::string(e.what()).find("magic bytes"), std::string::npos);
  }
  EXPECT_EQ(extractor.error_key(), "parquet_error");
}

TEST_F(ParquetExtractorTest, TooSmallFileThrows) {
  auto path = write("tiny.parquet", "PAR1PAR1");
  ParquetExtractor extractor;
  EXPECT_THROW(extractor.extract(path), FormatExtractorError);
}

TEST_F(ParquetExtractorTest, TruncatedFooterThrows) {
  std::vector<std::uint8_t> footer = sample_footer();
  footer.resize(footer.size() / 2);
  EXPECT_THROW(ParquetExtractor::decode_footer(footer.data(), footer.size()),
               FormatExtractorError);
}

TEST_F(ParquetExtractorTest, FooterLengthOutOfRangeThrows) {
  std::string file = parquet_file(sample_footer());
  // Overwrite the length with something larger than the file
  const std::size_t len_pos = file.size() - 8;
  file[len_pos] = '\xFF';
  file[len_pos + 1] = '\xFF';
  file[len_pos + 2] = '\xFF';
  file[len_pos + 3] = '\x0F';
  auto path = write("badlen.parquet", file);

  ParquetExtractor extractor;
  EXPECT_THROW(extractor.extract(path), FormatExtractorError);
}

}  // namespace intake_core

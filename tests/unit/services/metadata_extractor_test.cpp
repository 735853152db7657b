#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <unistd.h>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "intake_core/services/metadata_extractor.hpp"

namespace intake_core {

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class MetadataExtractorTest : public intake_tests::TempDirTestBase {
 protected:
  MetadataExtractor make_extractor() {
    return MetadataExtractor(std::make_shared<ExtractorFactory>(), ChecksumCalculator(),
                             make_null_logger());
  }
};

TEST_F(MetadataExtractorTest, CsvRecordHasBaseFactsAndShape) {
  auto path = write("a.csv", "id,name\n1,a\n2,b\n3,c\n");
  FileMetadataRecord record = make_extractor().extract(path);

  ASSERT_TRUE(record.succeeded());
  EXPECT_EQ(record.file_path, path.string());
  EXPECT_EQ(record.file_name, "a.csv");
  EXPECT_EQ(record.file_extension, ".csv");
  EXPECT_EQ(record.file_size, std::filesystem::file_size(path));
  ASSERT_TRUE(record.checksum.has_value());
  EXPECT_EQ(*record.checksum, ChecksumCalculator().file_digest(path));

  const auto* tabular = std::get_if<TabularDetails>(&record.details);
  ASSERT_NE(tabular, nullptr);
  EXPECT_EQ(tabular->row_count, 3);
  EXPECT_EQ(tabular->column_count, 2);
  EXPECT_EQ(tabular->column_names, (std::vector<std::string>{"id", "name"}));
}

TEST_F(MetadataExtractorTest, ExtensionIsLowercased) {
  auto path = write("UPPER.JSON", "{}");
  FileMetadataRecord record = make_extractor().extract(path);
  ASSERT_TRUE(record.succeeded());
  EXPECT_EQ(record.file_extension, ".json");
  EXPECT_TRUE(std::holds_alternative<JsonDetails>(record.details));
}

TEST_F(MetadataExtractorTest, TextFileKeepsOnlyBaseFacts) {
  auto path = write("notes.txt", "hello");
  FileMetadataRecord record = make_extractor().extract(path);

  ASSERT_TRUE(record.succeeded());
  EXPECT_TRUE(record.checksum.has_value());
  EXPECT_TRUE(std::holds_alternative<std::monostate>(record.details));
  EXPECT_FALSE(record.format_error.has_value());
}

TEST_F(MetadataExtractorTest, BranchFailureDegradesToScopedError) {
  auto path = write("broken.json", "{not json");
  FileMetadataRecord record = make_extractor().extract(path);

  EXPECT_TRUE(record.succeeded());
  EXPECT_TRUE(record.checksum.has_value());
  ASSERT_TRUE(record.format_error_key.has_value());
  EXPECT_EQ(*record.format_error_key, "json_error");
  EXPECT_TRUE(std::holds_alternative<std::monostate>(record.details));
}

TEST_F(MetadataExtractorTest, MissingFileIsAFullFailure) {
  FileMetadataRecord record = make_extractor().extract(temp_dir_ / "gone.csv");
  EXPECT_FALSE(record.succeeded());
  EXPECT_EQ(record.file_path, (temp_dir_ / "gone.csv").string());
  EXPECT_FALSE(record.checksum.has_value());
}

TEST_F(MetadataExtractorTest, DirectoryIsAFullFailure) {
  std::filesystem::create_directories(temp_dir_ / "folder.csv");
  FileMetadataRecord record = make_extractor().extract(temp_dir_ / "folder.csv");
  EXPECT_FALSE(record.succeeded());
}

TEST_F(MetadataExtractorTest, UnreadableFileIsAFullFailure) {
  if (::geteuid() == 0) {
    GTEST_SKIP() << "root ignores file permissions";
  }
  auto path = write("locked.csv", "id\n1\n");
  std::filesystem::permissions(path, std::filesystem::perms::none);

  FileMetadataRecord record = make_extractor().extract(path);
  std::filesystem::permissions(path, std::filesystem::perms::owner_all);

  EXPECT_FALSE(record.succeeded());
  EXPECT_FALSE(record.checksum.has_value());
}

TEST_F(MetadataExtractorTest, ChecksumIsDeterministicAcrossNames) {
  auto first = write("one.csv", "a,b\n1,2\n");
  auto second = write("two.csv", "a,b\n1,2\n");
  MetadataExtractor extractor = make_extractor();

  EXPECT_EQ(extractor.extract(first).checksum, extractor.extract(first).checksum);
  EXPECT_EQ(extractor.extract(first).checksum, extractor.extract(second).checksum);
}

TEST_F(MetadataExtractorTest, UsesBranchChosenByFactory) {
  auto factory = std::make_shared<intake_tests::MockExtractorFactory>();
  intake_tests::MockFormatExtractor branch;
  auto path = write("data.csv", "x\n");

  TabularDetails details;
  details.row_count = 99;
  EXPECT_CALL(*factory, find_extractor_for(_)).WillOnce(Return(&branch));
  EXPECT_CALL(branch, extract(_)).WillOnce(Return(FormatDetails{details}));

  MetadataExtractor extractor(factory, ChecksumCalculator(), make_null_logger());
  FileMetadataRecord record = extractor.extract(path);
  ASSERT_TRUE(record.succeeded());
  EXPECT_EQ(std::get<TabularDetails>(record.details).row_count, 99);
}

TEST_F(MetadataExtractorTest, BranchExceptionUsesBranchErrorKey) {
  auto factory = std::make_shared<intake_tests::MockExtractorFactory>();
  intake_tests::MockFormatExtractor branch;
  auto path = write("data.parquet", "x");

  EXPECT_CALL(*factory, find_extractor_for(_)).WillOnce(Return(&branch));
  EXPECT_CALL(branch, extract(_)).WillOnce(Throw(std::runtime_error("boom")));
  EXPECT_CALL(branch, error_key()).WillRepeatedly(Return("parquet_error"));
  EXPECT_CALL(branch, get_file_format()).WillRepeatedly(Return(FileFormat::Columnar));

  MetadataExtractor extractor(factory, ChecksumCalculator(), make_null_logger());
  FileMetadataRecord record = extractor.extract(path);
  EXPECT_TRUE(record.succeeded());
  EXPECT_EQ(record.format_error_key, std::optional<std::string>("parquet_error"));
  EXPECT_EQ(record.format_error, std::optional<std::string>("boom"));
}

}  // namespace intake_core

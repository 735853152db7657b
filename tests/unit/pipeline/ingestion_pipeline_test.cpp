#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <stdexcept>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "intake_core/pipeline/ingestion_pipeline.hpp"

namespace intake_core {

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class IngestionPipelineTest : public intake_tests::LogStoreTestBase {
 protected:
  void SetUp() override {
    LogStoreTestBase::SetUp();
    incoming_ = temp_dir_ / "incoming";
    std::filesystem::create_directories(incoming_);
  }

  std::shared_ptr<IngestionPipeline> make_pipeline(std::vector<std::filesystem::path> dirs,
                                                   int workers = 1) {
    auto detector = std::make_shared<FileDetector>(std::move(dirs), logger_);
    auto extractor = std::make_shared<MetadataExtractor>(std::make_shared<ExtractorFactory>(),
                                                         ChecksumCalculator(), logger_);
    return std::make_shared<IngestionPipeline>(detector, extractor, log_store_, logger_,
                                               PipelineOptions{workers});
  }

  std::filesystem::path incoming_;
};

TEST_F(IngestionPipelineTest, ProcessesEveryDetectedFile) {
  // Arrange
  write("incoming/a.csv", "x,y\n1,2\n3,4\n5,6\n");
  write("incoming/b.json", R"([{"x":1},{"x":2}])");
  auto pipeline = make_pipeline({incoming_});

  // Act
  auto summary = pipeline->run();

  // Assert
  EXPECT_FALSE(summary.error.has_value());
  EXPECT_EQ(summary.total_files, 2);
  EXPECT_EQ(summary.processed_count, 2);
  EXPECT_EQ(summary.failed_count, 0);
  ASSERT_EQ(summary.results.size(), 2u);

  auto csv = log_store_->get_metadata((incoming_ / "a.csv").string());
  ASSERT_TRUE(csv.has_value());
  EXPECT_EQ(std::get<TabularDetails>(csv->details).row_count, 3);

  auto json = log_store_->get_metadata((incoming_ / "b.json").string());
  ASSERT_TRUE(json.has_value());
  const auto& details = std::get<JsonDetails>(json->details);
  ASSERT_TRUE(details.sample_keys.has_value());
  EXPECT_EQ(*details.sample_keys, std::vector<std::string>{"x"});
}

TEST_F(IngestionPipelineTest, HistoryHasStartOutcomesAndComplete) {
  write("incoming/a.csv", "x\n1\n");
  write("incoming/b.txt", "hello");
  write("incoming/ignored.bin", "xx");
  auto pipeline = make_pipeline({incoming_});

  auto summary = pipeline->run();

  auto history = log_store_->get_history();
  ASSERT_EQ(history.size(), 4u);
  EXPECT_EQ(history.front().event, IngestionEvent::Start);
  EXPECT_EQ(history.front().files_detected, 2);
  EXPECT_EQ(history[1].event, IngestionEvent::FileProcessed);
  EXPECT_EQ(history[2].event, IngestionEvent::FileProcessed);
  EXPECT_EQ(history.back().event, IngestionEvent::Complete);
  EXPECT_EQ(history.back().processed_count, 2);
  EXPECT_EQ(history.back().failed_count, 0);
  for (const auto& entry : history) {
    EXPECT_EQ(entry.session_id, summary.session_id);
  }
}

TEST_F(IngestionPipelineTest, UnreadableFileCountsAsFailed) {
  if (geteuid() == 0) {
    GTEST_SKIP() << "root ignores file permissions";
  }
  write("incoming/a.csv", "x\n1\n");
  auto corrupt = write("incoming/corrupt.csv", "x\n1\n");
  std::filesystem::permissions(corrupt, std::filesystem::perms::none);
  auto pipeline = make_pipeline({incoming_});

  auto summary = pipeline->run();
  std::filesystem::permissions(corrupt, std::filesystem::perms::owner_all);

  EXPECT_EQ(summary.total_files, 2);
  EXPECT_EQ(summary.processed_count, 1);
  EXPECT_EQ(summary.failed_count, 1);
  EXPECT_FALSE(log_store_->get_metadata(corrupt.string()).has_value());

  auto history = log_store_->get_history();
  ASSERT_EQ(history.size(), 4u);
  EXPECT_EQ(history.back().failed_count, 1);
}

TEST_F(IngestionPipelineTest, MalformedContentStillCountsAsProcessed) {
  write("incoming/broken.json", "{ not json");
  auto pipeline = make_pipeline({incoming_});

  auto summary = pipeline->run();

  EXPECT_EQ(summary.processed_count, 1);
  EXPECT_EQ(summary.failed_count, 0);
  auto stored = log_store_->get_metadata((incoming_ / "broken.json").string());
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->format_error_key, std::optional<std::string>("json_error"));
}

TEST_F(IngestionPipelineTest, MissingWatchDirectoryYieldsEmptyRun) {
  auto pipeline = make_pipeline({temp_dir_ / "does_not_exist"});

  auto summary = pipeline->run();

  EXPECT_FALSE(summary.error.has_value());
  EXPECT_EQ(summary.total_files, 0);
  EXPECT_EQ(summary.processed_count, 0);
  EXPECT_EQ(summary.failed_count, 0);
  auto history = log_store_->get_history();
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].event, IngestionEvent::Start);
  EXPECT_EQ(history[1].event, IngestionEvent::Complete);
}

TEST_F(IngestionPipelineTest, RepeatedRunsAppendHistoryAndKeepOneRecordPerPath) {
  write("incoming/a.csv", "x\n1\n");
  auto pipeline = make_pipeline({incoming_});

  auto first = pipeline->run();
  auto second = pipeline->run();

  EXPECT_NE(first.session_id, second.session_id);
  EXPECT_EQ(log_store_->get_history().size(), 6u);
  auto table = log_store_->get_all_metadata();
  ASSERT_EQ(table.size(), 1u);
  EXPECT_EQ(table.begin()->second.checksum, first.results[0].metadata->checksum);
}

TEST_F(IngestionPipelineTest, NonRecursiveRunSkipsSubdirectories) {
  write("incoming/top.csv", "x\n1\n");
  write("incoming/nested/deep.csv", "x\n1\n");
  auto pipeline = make_pipeline({incoming_});

  EXPECT_EQ(pipeline->run(false).total_files, 1);
  EXPECT_EQ(pipeline->run(true).total_files, 2);
}

TEST_F(IngestionPipelineTest, ParallelExtractionKeepsDetectionOrder) {
  for (int i = 0; i < 7; ++i) {
    write("incoming/f" + std::to_string(i) + ".csv", "x\n" + std::to_string(i) + "\n");
  }
  auto sequential = make_pipeline({incoming_}, 1)->run();
  auto parallel = make_pipeline({incoming_}, 3)->run();

  ASSERT_EQ(parallel.results.size(), 7u);
  EXPECT_EQ(parallel.processed_count, 7);
  for (std::size_t i = 0; i < parallel.results.size(); ++i) {
    EXPECT_EQ(parallel.results[i].file_path, sequential.results[i].file_path);
  }

  // Outcome rows of the parallel run follow detection order too
  auto history = log_store_->get_history(8);
  ASSERT_EQ(history.size(), 8u);
  for (std::size_t i = 0; i < 7; ++i) {
    EXPECT_EQ(history[i].file_path, parallel.results[i].file_path);
  }
}

TEST_F(IngestionPipelineTest, DetectorFailureAbortsRun) {
  auto detector = std::make_shared<intake_tests::MockFileDetector>();
  auto extractor = std::make_shared<intake_tests::MockMetadataExtractor>();
  EXPECT_CALL(*detector, detect(_)).WillOnce(Throw(std::runtime_error("disk vanished")));
  EXPECT_CALL(*extractor, extract(_)).Times(0);
  IngestionPipeline pipeline(detector, extractor, log_store_, logger_);

  auto summary = pipeline.run();

  ASSERT_TRUE(summary.error.has_value());
  EXPECT_EQ(*summary.error, "disk vanished");
  EXPECT_FALSE(summary.session_id.empty());
  EXPECT_EQ(summary.total_files, 0);
  EXPECT_EQ(summary.processed_count, 0);
  EXPECT_EQ(summary.failed_count, 0);
  EXPECT_TRUE(summary.results.empty());
  EXPECT_TRUE(log_store_->get_history().empty());
}

TEST_F(IngestionPipelineTest, ExtractorExceptionBecomesFailedFile) {
  auto detector = std::make_shared<intake_tests::MockFileDetector>();
  auto extractor = std::make_shared<intake_tests::MockMetadataExtractor>();
  const std::filesystem::path boom = "/data/boom.csv";
  const std::filesystem::path fine = "/data/fine.csv";
  EXPECT_CALL(*detector, detect(true)).WillOnce(Return(std::vector<std::filesystem::path>{boom, fine}));
  EXPECT_CALL(*extractor, extract(boom)).WillOnce(Throw(std::runtime_error("kaput")));
  EXPECT_CALL(*extractor, extract(fine))
      .WillOnce(Return(intake_tests::TestUtilities::create_test_record(fine.string())));
  IngestionPipeline pipeline(detector, extractor, log_store_, logger_);

  auto summary = pipeline.run();

  EXPECT_FALSE(summary.error.has_value());
  EXPECT_EQ(summary.processed_count, 1);
  EXPECT_EQ(summary.failed_count, 1);
  ASSERT_EQ(summary.results.size(), 2u);
  EXPECT_FALSE(summary.results[0].success);
  ASSERT_TRUE(summary.results[0].error.has_value());
  EXPECT_THAT(*summary.results[0].error, ::testing::HasSubstr("Unexpected error processing"));
  EXPECT_THAT(*summary.results[0].error, ::testing::HasSubstr("kaput"));
  EXPECT_TRUE(summary.results[1].success);

  auto history = log_store_->get_history();
  ASSERT_EQ(history.size(), 4u);
  EXPECT_FALSE(history[1].success);
  EXPECT_TRUE(history[2].success);
}

TEST_F(IngestionPipelineTest, ErrorRecordFromExtractorIsFailure) {
  auto detector = std::make_shared<intake_tests::MockFileDetector>();
  auto extractor = std::make_shared<intake_tests::MockMetadataExtractor>();
  const std::filesystem::path gone = "/data/gone.csv";
  EXPECT_CALL(*detector, detect(_)).WillOnce(Return(std::vector<std::filesystem::path>{gone}));
  EXPECT_CALL(*extractor, extract(gone))
      .WillOnce(Return(FileMetadataRecord::failure(gone.string(), "No such file")));
  IngestionPipeline pipeline(detector, extractor, log_store_, logger_);

  auto summary = pipeline.run();

  EXPECT_EQ(summary.failed_count, 1);
  ASSERT_TRUE(summary.results[0].metadata.has_value());
  EXPECT_EQ(summary.results[0].metadata->error, std::optional<std::string>("No such file"));
  EXPECT_FALSE(log_store_->get_metadata(gone.string()).has_value());
}

TEST_F(IngestionPipelineTest, SessionIdHasTimestampAndHexSuffix) {
  // 2024-03-05 07:08:09 UTC
  const TimePoint when = std::chrono::system_clock::time_point(std::chrono::seconds(1709622489));

  const std::string id = IngestionPipeline::make_session_id(when);

  EXPECT_THAT(id, ::testing::MatchesRegex("ingestion_20240305_070809_[0-9a-f]{6}"));
}

TEST_F(IngestionPipelineTest, ConcurrentRunsAreSerialized) {
  write("incoming/a.csv", "x\n1\n");
  auto pipeline = make_pipeline({incoming_});

  auto first = std::async(std::launch::async, [&] { return pipeline->run(); });
  auto second = std::async(std::launch::async, [&] { return pipeline->run(); });
  first.get();
  second.get();

  // Each session's three rows are contiguous
  auto history = log_store_->get_history();
  ASSERT_EQ(history.size(), 6u);
  EXPECT_EQ(history[0].session_id, history[2].session_id);
  EXPECT_EQ(history[3].session_id, history[5].session_id);
  EXPECT_NE(history[0].session_id, history[3].session_id);
}

}  // namespace intake_core

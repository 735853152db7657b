#include "utilities_test.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <unistd.h>

namespace intake_tests {

std::filesystem::path TestUtilities::create_temp_dir(const std::string& prefix) {
  static std::atomic<int> counter{0};
  static std::mt19937 rng{std::random_device{}()};

  auto root = std::filesystem::temp_directory_path() / "intake_tests";
  std::filesystem::create_directories(root);

  // pid + counter keeps parallel ctest runs apart; the random part covers reruns
  auto dir = root / (prefix + "_" + std::to_string(::getpid()) + "_" +
                     std::to_string(counter.fetch_add(1)) + "_" + std::to_string(rng()));
  std::filesystem::create_directories(dir);
  return dir;
}

void TestUtilities::cleanup_temp_dir(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);

  // Also cleanup the parent directory if it's empty
  auto parent_dir = dir.parent_path();
  if (std::filesystem::exists(parent_dir, ec) && std::filesystem::is_empty(parent_dir, ec)) {
    std::filesystem::remove(parent_dir, ec);
  }
}

std::filesystem::path TestUtilities::write_file(const std::filesystem::path& path,
                                                const std::string& content) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Cannot write test file " + path.string());
  }
  out << content;
  return path;
}

intake_core::FileMetadataRecord TestUtilities::create_test_record(const std::string& path,
                                                                  const std::string& checksum,
                                                                  std::int64_t row_count) {
  intake_core::FileMetadataRecord record;
  record.file_path = path;
  record.file_name = std::filesystem::path(path).filename().string();
  record.file_size = 128;
  record.file_extension = std::filesystem::path(path).extension().string();

  auto now = std::chrono::system_clock::now();
  record.created_time = now - std::chrono::hours(1);  // Created 1 hour ago
  record.modified_time = now - std::chrono::minutes(5);
  record.extraction_time = now;
  record.checksum = checksum;

  intake_core::TabularDetails details;
  details.row_count = row_count;
  details.column_count = 2;
  details.column_names = {"id", "name"};
  details.column_types = {{"id", "int64"}, {"name", "object"}};
  record.details = details;
  return record;
}

}  // namespace intake_tests

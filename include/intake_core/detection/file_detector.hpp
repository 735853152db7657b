#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "intake_core/logging/logger_factory.hpp"

namespace intake_core {

// Snapshot scan of the watched directories for files with a supported extension
class FileDetector {
 public:
  FileDetector(std::vector<std::filesystem::path> watch_directories, LoggerPtr logger);
  virtual ~FileDetector() = default;

  // Non-copyable
  FileDetector(const FileDetector&) = delete;
  FileDetector& operator=(const FileDetector&) = delete;

  // Missing or non-directory roots are skipped with a warning. Results are
  // grouped by root in configuration order and sorted by path within a root;
  // a file reachable from two roots is reported once.
  virtual std::vector<std::filesystem::path> detect(bool recursive) const;

  const std::vector<std::filesystem::path>& watch_directories() const {
    return watch_directories_;
  }

 private:
  bool accept(const std::filesystem::directory_entry& entry) const;
  void scan_directory(const std::filesystem::path& root,
                      bool recursive,
                      std::vector<std::filesystem::path>& out) const;

  std::vector<std::filesystem::path> watch_directories_;
  LoggerPtr logger_;
};

}  // namespace intake_core

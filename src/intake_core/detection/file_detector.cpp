#include "intake_core/detection/file_detector.hpp"

#include <algorithm>
#include <set>

#include "intake_core/types/file.hpp"

namespace intake_core {

FileDetector::FileDetector(std::vector<std::filesystem::path> watch_directories,
                           LoggerPtr logger)
    : watch_directories_(std::move(watch_directories)), logger_(std::move(logger)) {}

std::vector<std::filesystem::path> FileDetector::detect(bool recursive) const {
  std::vector<std::filesystem::path> detected;
  std::set<std::filesystem::path> seen;

  for (const auto& root : watch_directories_) {
    std::error_code ec;
    if (!std::filesystem::exists(root, ec)) {
      logger_->warn("Directory does not exist: {}", root.string());
      continue;
    }
    if (!std::filesystem::is_directory(root, ec)) {
      logger_->warn("Path is not a directory: {}", root.string());
      continue;
    }

    std::vector<std::filesystem::path> found;
    scan_directory(root, recursive, found);
    std::sort(found.begin(), found.end());

    for (auto& path : found) {
      auto key = std::filesystem::weakly_canonical(path, ec);
      if (ec) {
        key = std::filesystem::absolute(path);
      }
      if (seen.insert(key).second) {
        detected.push_back(std::move(path));
      }
    }
  }

  logger_->info("Detected {} files", detected.size());
  return detected;
}

bool FileDetector::accept(const std::filesystem::directory_entry& entry) const {
  std::error_code ec;
  // is_regular_file follows symlinks, so links to regular files are kept
  if (!entry.is_regular_file(ec) || ec) {
    return false;
  }
  return is_supported_extension(entry.path().extension().string());
}

void FileDetector::scan_directory(const std::filesystem::path& root,
                                  bool recursive,
                                  std::vector<std::filesystem::path>& out) const {
  const auto opts = std::filesystem::directory_options::skip_permission_denied;
  std::error_code ec;

  if (recursive) {
    auto it = std::filesystem::recursive_directory_iterator(root, opts, ec);
    const auto end = std::filesystem::recursive_directory_iterator();
    for (; !ec && it != end; it.increment(ec)) {
      if (accept(*it)) {
        out.push_back(it->path());
      }
    }
  } else {
    auto it = std::filesystem::directory_iterator(root, opts, ec);
    const auto end = std::filesystem::directory_iterator();
    for (; !ec && it != end; it.increment(ec)) {
      if (accept(*it)) {
        out.push_back(it->path());
      }
    }
  }

  if (ec) {
    logger_->warn("Scan of {} stopped early: {}", root.string(), ec.message());
  }
}

}  // namespace intake_core

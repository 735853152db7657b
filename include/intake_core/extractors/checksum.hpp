#pragma once

#include <filesystem>
#include <string>

namespace intake_core {

class ChecksumError : public std::exception {
 public:
  explicit ChecksumError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Streaming content digest over fixed-size chunks, hex encoded
class ChecksumCalculator {
 public:
  static constexpr std::size_t CHUNK_SIZE = 64 * 1024;

  // Any digest name OpenSSL knows (sha256, md5, sha1, sha512, ...)
  explicit ChecksumCalculator(std::string algorithm = "sha256");

  std::string file_digest(const std::filesystem::path& file_path) const;
  std::string digest(const std::string& content) const;

  const std::string& algorithm() const {
    return algorithm_;
  }

 private:
  std::string algorithm_;
};

}  // namespace intake_core

#include "intake_core/extractors/checksum.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace intake_core {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

const EVP_MD* lookup_digest(const std::string& algorithm) {
  const EVP_MD* md = EVP_get_digestbyname(algorithm.c_str());
  if (!md) {
    throw ChecksumError("Unknown checksum algorithm: " + algorithm);
  }
  return md;
}

DigestContext start_digest(const EVP_MD* md) {
  DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw ChecksumError("Failed to create EVP context for hashing");
  }
  if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
    throw ChecksumError("Failed to initialize digest");
  }
  return ctx;
}

std::string finish_digest(EVP_MD_CTX* ctx) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
    throw ChecksumError("Failed to finalize digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

}  // namespace

ChecksumCalculator::ChecksumCalculator(std::string algorithm) : algorithm_(std::move(algorithm)) {
  // Fail at construction rather than on the first file
  lookup_digest(algorithm_);
}

std::string ChecksumCalculator::file_digest(const std::filesystem::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ChecksumError("Could not open file for checksum: " + file_path.string());
  }

  DigestContext ctx = start_digest(lookup_digest(algorithm_));
  std::vector<char> chunk(CHUNK_SIZE);
  while (file_stream) {
    file_stream.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    const std::streamsize got = file_stream.gcount();
    if (got > 0 && EVP_DigestUpdate(ctx.get(), chunk.data(), static_cast<size_t>(got)) != 1) {
      throw ChecksumError("Failed to update digest");
    }
  }
  if (file_stream.bad()) {
    throw ChecksumError("Read error while hashing: " + file_path.string());
  }
  return finish_digest(ctx.get());
}

std::string ChecksumCalculator::digest(const std::string& content) const {
  DigestContext ctx = start_digest(lookup_digest(algorithm_));
  if (EVP_DigestUpdate(ctx.get(), content.data(), content.length()) != 1) {
    throw ChecksumError("Failed to update digest");
  }
  return finish_digest(ctx.get());
}

}  // namespace intake_core

#include "intake_core/extractors/format_extractor.hpp"

namespace intake_core {

bool FormatExtractor::has_extension(const fs::path& file_path,
                                    std::initializer_list<const char*> extensions) {
  const std::string extension = to_lower(file_path.extension().string());
  for (const char* candidate : extensions) {
    if (extension == candidate) {
      return true;
    }
  }
  return false;
}

}  // namespace intake_core

#include "ragdesk_core/extractors/content_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace ragdesk_core {

std::string ContentExtractor::get_string_content(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ContentExtractorError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  return buffer.str();
}

bool ContentExtractor::has_extension(const fs::path& file_path, const std::string& extension) {
  std::string actual = file_path.extension().string();
  std::transform(actual.begin(), actual.end(), actual.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return actual == extension;
}

}  // namespace ragdesk_core

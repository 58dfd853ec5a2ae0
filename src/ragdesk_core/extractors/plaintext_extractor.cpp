#include "ragdesk_core/extractors/plaintext_extractor.hpp"

namespace ragdesk_core {

bool PlainTextExtractor::can_handle(const fs::path& file_path) const {
  return has_extension(file_path, ".txt");
}

std::string PlainTextExtractor::extract_text(const fs::path& file_path) const {
  return get_string_content(file_path);
}

}  // namespace ragdesk_core

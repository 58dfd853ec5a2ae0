#include "ragdesk_core/extractors/markdown_extractor.hpp"

namespace ragdesk_core {

bool MarkdownExtractor::can_handle(const fs::path& file_path) const {
  return has_extension(file_path, ".md");
}

std::string MarkdownExtractor::extract_text(const fs::path& file_path) const {
  return get_string_content(file_path);
}

}  // namespace ragdesk_core

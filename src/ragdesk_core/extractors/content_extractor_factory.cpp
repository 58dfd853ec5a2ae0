#include "ragdesk_core/extractors/content_extractor_factory.hpp"

#include "ragdesk_core/extractors/docx_extractor.hpp"
#include "ragdesk_core/extractors/markdown_extractor.hpp"
#include "ragdesk_core/extractors/pdf_extractor.hpp"
#include "ragdesk_core/extractors/plaintext_extractor.hpp"

namespace ragdesk_core {
ContentExtractorFactory::ContentExtractorFactory() {
  extractors.push_back(std::make_unique<PlainTextExtractor>());
  extractors.push_back(std::make_unique<MarkdownExtractor>());
  extractors.push_back(std::make_unique<PdfExtractor>());
  extractors.push_back(std::make_unique<DocxExtractor>());
}

const ContentExtractor* ContentExtractorFactory::find_extractor_for(
    const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors) {
    if (extractor->can_handle(file_path)) {
      return extractor.get();
    }
  }
  return nullptr;
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(
    const std::filesystem::path& file_path) const {
  const ContentExtractor* extractor = find_extractor_for(file_path);
  if (!extractor) {
    throw ContentExtractorError("No suitable content extractor found for " + file_path.string());
  }
  return *extractor;
}
}  // namespace ragdesk_core

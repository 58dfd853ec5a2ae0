#include "ragdesk_core/extractors/pdf_extractor.hpp"

#include <poppler-document.h>
#include <poppler-page.h>

#include <memory>

namespace ragdesk_core {

bool PdfExtractor::can_handle(const fs::path& file_path) const {
  return has_extension(file_path, ".pdf");
}

std::string PdfExtractor::extract_text(const fs::path& file_path) const {
  std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(file_path.string()));
  if (!doc) {
    throw ContentExtractorError("Failed to open PDF: " + file_path.string());
  }
  if (doc->is_locked()) {
    throw ContentExtractorError("PDF is password protected: " + file_path.string());
  }

  std::string text;
  const int page_count = doc->pages();
  for (int i = 0; i < page_count; ++i) {
    if (i > 0) {
      text += "\n";
    }
    std::unique_ptr<poppler::page> page(doc->create_page(i));
    if (!page) {
      continue;
    }
    const poppler::byte_array utf8_page = page->text().to_utf8();
    text.append(utf8_page.data(), utf8_page.size());
  }
  return text;
}

}  // namespace ragdesk_core

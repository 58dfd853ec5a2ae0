#pragma once

#include "content_extractor.hpp"

namespace ragdesk_core {

// Extracts the text layer of every page with poppler-cpp, pages joined by "\n"
class PdfExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  std::string extract_text(const fs::path& file_path) const override;

  FileType get_file_type() const override {
    return FileType::PDF;
  }
};

}  // namespace ragdesk_core

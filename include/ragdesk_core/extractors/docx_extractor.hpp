#pragma once

#include "content_extractor.hpp"

namespace ragdesk_core {

// Reads word/document.xml out of a .docx archive. Each w:p becomes one line.
class DocxExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  std::string extract_text(const fs::path& file_path) const override;

  FileType get_file_type() const override {
    return FileType::Word;
  }

  // Flattens WordprocessingML body markup to text
  static std::string document_xml_to_text(const std::string& xml);
};

}  // namespace ragdesk_core

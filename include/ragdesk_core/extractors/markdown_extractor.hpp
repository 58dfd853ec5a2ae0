#pragma once

#include "content_extractor.hpp"

namespace ragdesk_core {

// Markdown is indexed as written, headings and markup included
class MarkdownExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  std::string extract_text(const fs::path& file_path) const override;

  FileType get_file_type() const override {
    return FileType::Markdown;
  }
};

}  // namespace ragdesk_core

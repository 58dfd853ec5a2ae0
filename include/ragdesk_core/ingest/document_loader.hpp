#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "ragdesk_core/types/document.hpp"

namespace ragdesk_core {

class ContentExtractorFactory;

// Scans a corpus directory and reduces every supported file to a Document
class DocumentLoader {
 public:
  DocumentLoader(std::shared_ptr<ContentExtractorFactory> extractor_factory,
                 std::vector<std::string> excluded_prefixes);

  /**
   * @brief Recursively loads all supported documents below data_dir.
   *
   * Paths are visited in sorted order. Files without an extractor, files whose
   * name starts with an excluded prefix and files whose text is only whitespace
   * are skipped. Each document gets a fresh UUID v4 id.
   *
   * @throw IngestionError if data_dir cannot be read or a file fails to extract.
   */
  std::vector<Document> load(const std::filesystem::path &data_dir) const;

  bool is_excluded(const std::filesystem::path &file_path) const;

 private:
  std::shared_ptr<ContentExtractorFactory> extractor_factory_;
  std::vector<std::string> excluded_prefixes_;
};

bool is_blank(const std::string &text);

}  // namespace ragdesk_core

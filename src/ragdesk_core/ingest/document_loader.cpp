#include "ragdesk_core/ingest/document_loader.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "ragdesk_core/errors.hpp"
#include "ragdesk_core/extractors/content_extractor_factory.hpp"
#include "ragdesk_core/util/uuid.hpp"

namespace ragdesk_core {

bool is_blank(const std::string &text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

DocumentLoader::DocumentLoader(std::shared_ptr<ContentExtractorFactory> extractor_factory,
                               std::vector<std::string> excluded_prefixes)
    : extractor_factory_(std::move(extractor_factory)),
      excluded_prefixes_(std::move(excluded_prefixes)) {}

bool DocumentLoader::is_excluded(const std::filesystem::path &file_path) const {
  const std::string name = file_path.filename().string();
  for (const auto &prefix : excluded_prefixes_) {
    if (!prefix.empty() && name.rfind(prefix, 0) == 0) {
      return true;
    }
  }
  return false;
}

std::vector<Document> DocumentLoader::load(const std::filesystem::path &data_dir) const {
  std::error_code ec;
  if (!std::filesystem::is_directory(data_dir, ec)) {
    throw IngestionError("Data directory is not readable: " + data_dir.string());
  }

  std::vector<std::filesystem::path> paths;
  try {
    for (const auto &entry : std::filesystem::recursive_directory_iterator(data_dir)) {
      if (entry.is_regular_file()) {
        paths.push_back(entry.path());
      }
    }
  } catch (const std::filesystem::filesystem_error &e) {
    throw IngestionError("Failed to scan data directory " + data_dir.string() + ": " + e.what());
  }
  std::sort(paths.begin(), paths.end());

  std::vector<Document> documents;
  for (const auto &path : paths) {
    const ContentExtractor *extractor = extractor_factory_->find_extractor_for(path);
    if (!extractor) {
      continue;
    }
    if (is_excluded(path)) {
      std::cout << "Skipping excluded document: " << path.string() << std::endl;
      continue;
    }

    std::string text;
    try {
      text = extractor->extract_text(path);
    } catch (const std::exception &e) {
      throw IngestionError("Failed to extract " + path.string() + ": " + e.what());
    }

    if (is_blank(text)) {
      std::cerr << "Warning: skipping empty document: " << path.string() << std::endl;
      continue;
    }

    documents.push_back({.id = uuid::generate(),
                         .path = path,
                         .text = std::move(text),
                         .type = extractor->get_file_type()});
    std::cout << "Loaded " << to_string(documents.back().type) << " document: " << path.string()
              << std::endl;
  }
  return documents;
}

}  // namespace ragdesk_core

#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "content_extractor.hpp"

/**
 * @class ContentExtractorFactory
 * @brief Manages and provides the correct ContentExtractor for a given file type.
 *
 * Holds one extractor per supported corpus format (.txt, .md, .pdf, .docx) and
 * selects by case-insensitive file extension. Files of any other type have no
 * extractor. This class is non-copyable and non-movable.
 */
namespace ragdesk_core {
class ContentExtractorFactory {
 public:
  /**
   * @brief Constructs the factory and registers all available extractors.
   */
  ContentExtractorFactory();

  /**
   * @brief Finds the extractor for the given file, if any.
   *
   * @param file_path The path to the file that needs to be processed.
   * @return The first registered extractor that can handle the file, or nullptr.
   */
  const ContentExtractor* find_extractor_for(const std::filesystem::path& file_path) const;

  /**
   * @brief Returns the extractor for the given file.
   *
   * @throw ContentExtractorError if no suitable extractor is found.
   */
  const ContentExtractor& get_extractor_for(const std::filesystem::path& file_path) const;

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  std::vector<std::unique_ptr<ContentExtractor>> extractors;
};
}  // namespace ragdesk_core

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "ragdesk_core/types/document.hpp"

namespace fs = std::filesystem;

namespace ragdesk_core {

class ContentExtractorError : public std::exception {
 public:
  explicit ContentExtractorError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  // Opens the file and reduces it to flat text
  virtual std::string extract_text(const fs::path& file_path) const = 0;

  virtual FileType get_file_type() const = 0;

 protected:
  // Reads the whole file as raw bytes
  std::string get_string_content(const fs::path& file_path) const;

  // Case-insensitive extension match, `extension` includes the dot
  static bool has_extension(const fs::path& file_path, const std::string& extension);
};

using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace ragdesk_core

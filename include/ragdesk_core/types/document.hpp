#pragma once

#include <filesystem>
#include <string>

namespace ragdesk_core {

// Source formats the loader can reduce to flat text
enum class FileType { Text, Markdown, PDF, Word, Unknown };

std::string to_string(FileType type);
FileType file_type_from_string(const std::string& str);

// A source file picked up by the corpus scan. Never persisted, only its chunks are.
struct Document {
  std::string id;
  std::filesystem::path path;
  std::string text;
  FileType type = FileType::Unknown;
};

}  // namespace ragdesk_core

#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace ragdesk_core {

class DocumentLoader;
class TokenChunker;
class StoreBuilder;

struct IngestionReport {
  size_t documents = 0;
  size_t chunks = 0;
  size_t dim = 0;
  std::string model;
  std::filesystem::path store_dir;
};

// Offline pipeline: scan -> chunk -> embed -> persist. Overwrites any prior store.
class IngestionService {
 public:
  IngestionService(std::shared_ptr<DocumentLoader> loader,
                   std::shared_ptr<TokenChunker> chunker,
                   std::shared_ptr<StoreBuilder> builder);

  // Throws IngestionError when the scan yields no chunks; nothing is written in that case
  IngestionReport ingest(const std::filesystem::path &data_dir,
                         const std::filesystem::path &store_dir) const;

 private:
  std::shared_ptr<DocumentLoader> loader_;
  std::shared_ptr<TokenChunker> chunker_;
  std::shared_ptr<StoreBuilder> builder_;
};

}  // namespace ragdesk_core

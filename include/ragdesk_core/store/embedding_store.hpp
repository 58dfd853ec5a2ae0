#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "ragdesk_core/store/npy_io.hpp"
#include "ragdesk_core/types/chunk.hpp"

namespace ragdesk_core {

// Contents of meta.json. dim, tokenizer and chunk_digest are absent in stores
// written by older tooling and are only verified when present.
struct StoreMeta {
  std::string model;
  size_t count = 0;
  std::optional<size_t> dim;
  std::optional<std::string> tokenizer;
  std::optional<std::string> chunk_digest;
};

/**
 * @class EmbeddingStore
 * @brief Ordered chunk list paired by position with an embedding matrix.
 *
 * On disk the store is three files in one directory: embeddings.npy,
 * chunks.jsonl and meta.json. Row i of the matrix is the embedding of chunk i.
 * The chunk order is sealed by a SHA-256 digest of the chunk ids recorded in
 * meta.json. A store is immutable once constructed.
 */
class EmbeddingStore {
 public:
  static constexpr const char *kEmbeddingsFile = "embeddings.npy";
  static constexpr const char *kChunksFile = "chunks.jsonl";
  static constexpr const char *kMetaFile = "meta.json";

  // Throws StoreLoadError when counts, dimension or digest disagree
  EmbeddingStore(std::vector<ChunkRecord> chunks, EmbeddingMatrix embeddings, StoreMeta meta);

  // Throws StoreLoadError for missing or malformed artifacts
  static EmbeddingStore load(const std::filesystem::path &store_dir);

  // Writes all three artifacts to temporary files and renames them into place.
  // Throws IngestionError if the directory is not writable.
  void save(const std::filesystem::path &store_dir) const;

  static std::string compute_chunk_digest(const std::vector<ChunkRecord> &chunks);

  const std::vector<ChunkRecord> &chunks() const {
    return chunks_;
  }
  const EmbeddingMatrix &embeddings() const {
    return embeddings_;
  }
  const StoreMeta &meta() const {
    return meta_;
  }
  size_t size() const {
    return chunks_.size();
  }
  bool empty() const {
    return chunks_.empty();
  }

 private:
  std::vector<ChunkRecord> chunks_;
  EmbeddingMatrix embeddings_;
  StoreMeta meta_;

  void validate() const;
};

}  // namespace ragdesk_core

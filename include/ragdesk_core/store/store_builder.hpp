#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ragdesk_core/llm/embedder.hpp"
#include "ragdesk_core/store/embedding_store.hpp"

namespace ragdesk_core {

// Embeds chunk texts in order-preserving batches and assembles an EmbeddingStore
class StoreBuilder {
 public:
  StoreBuilder(std::shared_ptr<const Embedder> embedder, size_t batch_size = 32);

  /**
   * @brief Embeds every chunk and returns the sealed store.
   *
   * Row i of the matrix is the embedding of chunks[i]. The build aborts with an
   * UpstreamError when a batch returns the wrong number of vectors or a
   * dimension different from earlier batches.
   */
  EmbeddingStore build(std::vector<ChunkRecord> chunks, const std::string &tokenizer_name) const;

 private:
  std::shared_ptr<const Embedder> embedder_;
  size_t batch_size_;
};

}  // namespace ragdesk_core

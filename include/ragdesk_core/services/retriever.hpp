#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ragdesk_core/llm/embedder.hpp"
#include "ragdesk_core/store/embedding_store.hpp"
#include "ragdesk_core/types/context.hpp"

namespace faiss {
struct IndexFlatIP;
}

namespace ragdesk_core {

/**
 * @class Retriever
 * @brief Exact cosine nearest-neighbour search over a loaded EmbeddingStore.
 *
 * Owns the store and a faiss inner-product index built once over the
 * L2-normalized embedding matrix. search() has no side effects and may be
 * called concurrently.
 */
class Retriever {
 public:
  // Throws ModelMismatchError when the store was built with a different embedding model
  Retriever(EmbeddingStore store, std::shared_ptr<const Embedder> embedder);
  ~Retriever();

  Retriever(const Retriever &) = delete;
  Retriever &operator=(const Retriever &) = delete;

  /**
   * @brief Returns the min(k, size()) chunks most similar to the query.
   *
   * Contexts are ordered by non-increasing cosine similarity, ties by chunk
   * order. An empty store yields an empty result.
   *
   * @throw InvalidInputError for an empty query or k < 1.
   * @throw UpstreamError if the embedder fails or returns the wrong dimension.
   */
  std::vector<Context> search(const std::string &query, int k) const;

  size_t size() const {
    return store_.size();
  }
  const EmbeddingStore &store() const {
    return store_;
  }

 private:
  EmbeddingStore store_;
  std::shared_ptr<const Embedder> embedder_;
  std::unique_ptr<faiss::IndexFlatIP> index_;

  void build_index();
};

}  // namespace ragdesk_core

#include "ragdesk_core/store/store_builder.hpp"

#include <algorithm>
#include <iostream>

#include "ragdesk_core/errors.hpp"

namespace ragdesk_core {

StoreBuilder::StoreBuilder(std::shared_ptr<const Embedder> embedder, size_t batch_size)
    : embedder_(std::move(embedder)), batch_size_(batch_size) {
  if (!embedder_) {
    throw InvalidInputError("StoreBuilder requires an embedder");
  }
  if (batch_size_ == 0) {
    throw InvalidInputError("Embedding batch size must be greater than 0");
  }
}

EmbeddingStore StoreBuilder::build(std::vector<ChunkRecord> chunks,
                                   const std::string &tokenizer_name) const {
  EmbeddingMatrix matrix;
  matrix.data.reserve(chunks.size());

  for (size_t start = 0; start < chunks.size(); start += batch_size_) {
    const size_t end = std::min(start + batch_size_, chunks.size());
    std::vector<std::string> texts;
    texts.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
      texts.push_back(chunks[i].text);
    }

    const std::vector<std::vector<float>> vectors = embedder_->embed(texts);
    if (vectors.size() != texts.size()) {
      throw UpstreamError("Embedding batch returned " + std::to_string(vectors.size()) +
                          " vectors for " + std::to_string(texts.size()) + " chunks");
    }
    for (const auto &vector : vectors) {
      if (matrix.rows == 0) {
        if (vector.empty()) {
          throw UpstreamError("Embedding model returned an empty vector");
        }
        matrix.dim = vector.size();
        matrix.data.reserve(chunks.size() * matrix.dim);
      } else if (vector.size() != matrix.dim) {
        throw UpstreamError("Embedding dimension changed from " + std::to_string(matrix.dim) +
                            " to " + std::to_string(vector.size()) + " during the build");
      }
      matrix.data.insert(matrix.data.end(), vector.begin(), vector.end());
      ++matrix.rows;
    }
    std::cout << "Embedded " << end << "/" << chunks.size() << " chunks" << std::endl;
  }

  StoreMeta meta;
  meta.model = embedder_->model_id();
  meta.count = chunks.size();
  meta.dim = matrix.dim;
  meta.tokenizer = tokenizer_name;
  meta.chunk_digest = EmbeddingStore::compute_chunk_digest(chunks);
  return EmbeddingStore(std::move(chunks), std::move(matrix), std::move(meta));
}

}  // namespace ragdesk_core

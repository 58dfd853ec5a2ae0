#include "ragdesk_core/services/retriever.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <filesystem>
#include <numeric>

#include "ragdesk_core/errors.hpp"

namespace ragdesk_core {

Retriever::Retriever(EmbeddingStore store, std::shared_ptr<const Embedder> embedder)
    : store_(std::move(store)), embedder_(std::move(embedder)) {
  if (!embedder_) {
    throw InvalidInputError("Retriever requires an embedder");
  }
  if (store_.meta().model != embedder_->model_id()) {
    throw ModelMismatchError("Store was built with embedding model '" + store_.meta().model +
                             "' but the configured model is '" + embedder_->model_id() + "'");
  }
  build_index();
}

Retriever::~Retriever() = default;

void Retriever::build_index() {
  const EmbeddingMatrix &matrix = store_.embeddings();
  if (matrix.rows == 0) {
    return;
  }

  // Inner product over unit vectors is cosine similarity
  std::vector<float> normalized = matrix.data;
  faiss::fvec_renorm_L2(matrix.dim, matrix.rows, normalized.data());

  index_ = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(matrix.dim));
  index_->add(static_cast<faiss::idx_t>(matrix.rows), normalized.data());
}

std::vector<Context> Retriever::search(const std::string &query, int k) const {
  if (query.empty()) {
    throw InvalidInputError("Query cannot be empty");
  }
  if (k < 1) {
    throw InvalidInputError("k must be at least 1, got " + std::to_string(k));
  }
  if (!index_ || index_->ntotal == 0) {
    return {};
  }

  const std::vector<std::vector<float>> embedded = embedder_->embed({query});
  if (embedded.size() != 1) {
    throw UpstreamError("Embedder returned " + std::to_string(embedded.size()) +
                        " vectors for one query");
  }
  std::vector<float> query_vector = embedded.front();
  if (query_vector.size() != store_.embeddings().dim) {
    throw UpstreamError("Query vector dimension mismatch. Expected " +
                        std::to_string(store_.embeddings().dim) + ", got " +
                        std::to_string(query_vector.size()));
  }
  faiss::fvec_renorm_L2(query_vector.size(), 1, query_vector.data());

  const int actual_k = std::min(k, static_cast<int>(index_->ntotal));
  std::vector<float> similarities(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  index_->search(1, query_vector.data(), actual_k, similarities.data(), labels.data());

  std::vector<size_t> order(actual_k);
  std::iota(order.begin(), order.end(), 0);
  std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    if (similarities[a] != similarities[b]) {
      return similarities[a] > similarities[b];
    }
    return labels[a] < labels[b];
  });

  std::vector<Context> contexts;
  contexts.reserve(actual_k);
  for (size_t i : order) {
    if (labels[i] < 0) {
      continue;
    }
    const ChunkRecord &chunk = store_.chunks()[static_cast<size_t>(labels[i])];
    contexts.push_back({.text = chunk.text,
                        .source = chunk.source,
                        .title = std::filesystem::path(chunk.source).filename().string(),
                        .score = std::clamp(similarities[i], -1.0f, 1.0f)});
  }
  return contexts;
}

}  // namespace ragdesk_core

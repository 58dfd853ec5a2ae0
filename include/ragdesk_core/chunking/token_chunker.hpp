#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ragdesk_core/tokenizer/bpe_tokenizer.hpp"
#include "ragdesk_core/types/chunk.hpp"
#include "ragdesk_core/types/document.hpp"

namespace ragdesk_core {

struct ChunkingOptions {
  size_t max_tokens = 400;
  size_t overlap_tokens = 60;
};

// Half-open token range [begin, end)
struct TokenSpan {
  size_t begin;
  size_t end;
};

/**
 * @class TokenChunker
 * @brief Splits document text into overlapping windows measured in tokenizer units.
 *
 * Consecutive windows share exactly `overlap_tokens` tokens and window starts step by
 * `max_tokens - overlap_tokens`. The first window reaching the end of the token
 * sequence is the last one, so a document of at most `max_tokens` tokens is a single chunk.
 */
class TokenChunker {
 public:
  // Throws InvalidInputError for max_tokens == 0; clamps overlap_tokens to max_tokens - 1
  TokenChunker(std::shared_ptr<const BpeTokenizer> tokenizer, ChunkingOptions options);

  std::vector<std::string> split(const std::string &text) const;

  // Chunk records carry ids `{doc_id}::{i}` in token-offset order
  std::vector<ChunkRecord> chunk_document(const Document &document) const;

  const ChunkingOptions &options() const {
    return options_;
  }
  const BpeTokenizer &tokenizer() const {
    return *tokenizer_;
  }

  // Requires max_tokens > overlap_tokens, otherwise throws InvalidInputError
  static std::vector<TokenSpan> plan_spans(size_t token_count, const ChunkingOptions &options);

 private:
  std::shared_ptr<const BpeTokenizer> tokenizer_;
  ChunkingOptions options_;
};

}  // namespace ragdesk_core

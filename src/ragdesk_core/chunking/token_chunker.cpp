#include "ragdesk_core/chunking/token_chunker.hpp"

#include <algorithm>
#include <iostream>

#include "ragdesk_core/errors.hpp"

namespace ragdesk_core {

TokenChunker::TokenChunker(std::shared_ptr<const BpeTokenizer> tokenizer, ChunkingOptions options)
    : tokenizer_(std::move(tokenizer)), options_(options) {
  if (!tokenizer_) {
    throw InvalidInputError("TokenChunker requires a tokenizer");
  }
  if (options_.max_tokens == 0) {
    throw InvalidInputError("chunk max_tokens must be greater than 0");
  }
  if (options_.overlap_tokens >= options_.max_tokens) {
    std::cerr << "Warning: chunk overlap " << options_.overlap_tokens
              << " is not smaller than max_tokens " << options_.max_tokens << ", clamping to "
              << options_.max_tokens - 1 << std::endl;
    options_.overlap_tokens = options_.max_tokens - 1;
  }
}

std::vector<TokenSpan> TokenChunker::plan_spans(size_t token_count,
                                                const ChunkingOptions &options) {
  if (options.max_tokens == 0 || options.overlap_tokens >= options.max_tokens) {
    throw InvalidInputError("Chunk step must be positive (max_tokens " +
                            std::to_string(options.max_tokens) + ", overlap " +
                            std::to_string(options.overlap_tokens) + ")");
  }

  std::vector<TokenSpan> spans;
  const size_t step = options.max_tokens - options.overlap_tokens;
  for (size_t start = 0; start < token_count; start += step) {
    const size_t end = std::min(start + options.max_tokens, token_count);
    spans.push_back({.begin = start, .end = end});
    if (end == token_count) {
      break;
    }
  }
  return spans;
}

std::vector<std::string> TokenChunker::split(const std::string &text) const {
  const std::vector<Token> tokens = tokenizer_->encode(text);

  std::vector<std::string> chunks;
  for (const TokenSpan &span : plan_spans(tokens.size(), options_)) {
    chunks.push_back(tokenizer_->decode(tokens.begin() + static_cast<std::ptrdiff_t>(span.begin),
                                        tokens.begin() + static_cast<std::ptrdiff_t>(span.end)));
  }
  return chunks;
}

std::vector<ChunkRecord> TokenChunker::chunk_document(const Document &document) const {
  std::vector<ChunkRecord> records;
  const std::vector<std::string> texts = split(document.text);
  records.reserve(texts.size());
  for (size_t i = 0; i < texts.size(); ++i) {
    records.push_back({.doc_id = document.id,
                       .source = document.path.string(),
                       .chunk_id = make_chunk_id(document.id, i),
                       .text = texts[i]});
  }
  return records;
}

}  // namespace ragdesk_core

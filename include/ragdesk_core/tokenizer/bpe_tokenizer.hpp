#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace ragdesk_core {

class TokenizerError : public std::exception {
 public:
  explicit TokenizerError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

using Token = uint32_t;

/**
 * @class BpeTokenizer
 * @brief Byte-level BPE tokenizer driven by a tiktoken rank file.
 *
 * The rank file holds one `base64(token_bytes) rank` pair per line, e.g.
 * `cl100k_base.tiktoken`. Every single byte must have a rank so that any input
 * can be encoded. Text is first split into pieces with the cl100k
 * pre-tokenization rules and each piece is then merged by lowest pair rank.
 * The tokenizer is immutable after construction and safe to share between threads.
 */
class BpeTokenizer {
 public:
  BpeTokenizer(std::unordered_map<std::string, Token> ranks, std::string name);

  // Loads a rank file; the tokenizer name is the file stem
  static BpeTokenizer from_file(const std::filesystem::path &rank_file);

  std::vector<Token> encode(const std::string &text) const;

  // Invalid UTF-8 in the concatenated bytes is replaced with U+FFFD
  std::string decode(std::vector<Token>::const_iterator first,
                     std::vector<Token>::const_iterator last) const;
  std::string decode(const std::vector<Token> &tokens) const;

  const std::string &name() const {
    return name_;
  }
  size_t vocab_size() const {
    return encoder_.size();
  }

  // cl100k pre-tokenization. Exposed for tests.
  static std::vector<std::string> split_pieces(const std::string &text);

 private:
  std::unordered_map<std::string, Token> encoder_;
  std::unordered_map<Token, std::string> decoder_;
  std::string name_;

  void encode_piece(const std::string &piece, std::vector<Token> &out) const;
};

}  // namespace ragdesk_core

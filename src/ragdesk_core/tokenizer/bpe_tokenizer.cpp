#include "ragdesk_core/tokenizer/bpe_tokenizer.hpp"

#include <unicode/uchar.h>
#include <utf8.h>

#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>

#include "ragdesk_core/util/digest.hpp"

namespace ragdesk_core {

namespace {

bool is_newline(uint32_t cp) {
  return cp == '\n' || cp == '\r';
}

// Character classes of the cl100k_base pre-tokenization pattern: \s is the
// White_Space property, \p{L} and \p{N} are the general category groups.
bool is_space(uint32_t cp) {
  return u_hasBinaryProperty(static_cast<UChar32>(cp), UCHAR_WHITE_SPACE);
}

bool is_digit(uint32_t cp) {
  return (U_GET_GC_MASK(static_cast<UChar32>(cp)) & U_GC_N_MASK) != 0;
}

bool is_letter(uint32_t cp) {
  return (U_GET_GC_MASK(static_cast<UChar32>(cp)) & U_GC_L_MASK) != 0;
}

bool is_symbol(uint32_t cp) {
  return !is_space(cp) && !is_letter(cp) && !is_digit(cp);
}

uint32_t lower_ascii(uint32_t cp) {
  return (cp >= 'A' && cp <= 'Z') ? cp + ('a' - 'A') : cp;
}

// Length of an English contraction ('s 't 're 've 'm 'll 'd) starting at i, or 0
size_t contraction_length(const std::vector<uint32_t> &cps, size_t i) {
  if (cps[i] != '\'' || i + 1 >= cps.size()) {
    return 0;
  }
  const uint32_t first = lower_ascii(cps[i + 1]);
  if (first == 's' || first == 't' || first == 'm' || first == 'd') {
    return 2;
  }
  if (i + 2 >= cps.size()) {
    return 0;
  }
  const uint32_t second = lower_ascii(cps[i + 2]);
  if ((first == 'r' && second == 'e') || (first == 'v' && second == 'e') ||
      (first == 'l' && second == 'l')) {
    return 3;
  }
  return 0;
}

// Returns the end (exclusive) of the piece starting at i
size_t next_piece_end(const std::vector<uint32_t> &cps, size_t i) {
  const size_t n = cps.size();

  if (size_t len = contraction_length(cps, i); len > 0) {
    return i + len;
  }

  // [^\r\n\p{L}\p{N}]?\p{L}+
  size_t j = i;
  if (!is_letter(cps[j]) && !is_newline(cps[j]) && !is_digit(cps[j]) && j + 1 < n &&
      is_letter(cps[j + 1])) {
    ++j;
  }
  if (is_letter(cps[j])) {
    while (j < n && is_letter(cps[j])) {
      ++j;
    }
    return j;
  }

  // \p{N}{1,3}
  if (is_digit(cps[i])) {
    j = i;
    while (j < n && j - i < 3 && is_digit(cps[j])) {
      ++j;
    }
    return j;
  }

  // ' '?[^\s\p{L}\p{N}]+[\r\n]*
  j = i;
  if (cps[j] == ' ' && j + 1 < n) {
    ++j;
  }
  if (is_symbol(cps[j])) {
    while (j < n && is_symbol(cps[j])) {
      ++j;
    }
    while (j < n && is_newline(cps[j])) {
      ++j;
    }
    return j;
  }

  if (is_space(cps[i])) {
    size_t run_end = i;
    size_t last_newline = n;
    while (run_end < n && is_space(cps[run_end])) {
      if (is_newline(cps[run_end])) {
        last_newline = run_end;
      }
      ++run_end;
    }
    // \s*[\r\n]+
    if (last_newline != n) {
      return last_newline + 1;
    }
    // \s+(?!\S)
    if (run_end == n) {
      return run_end;
    }
    if (run_end - i >= 2) {
      return run_end - 1;
    }
    // \s+
    return run_end;
  }

  return i + 1;
}

}  // namespace

BpeTokenizer::BpeTokenizer(std::unordered_map<std::string, Token> ranks, std::string name)
    : encoder_(std::move(ranks)), name_(std::move(name)) {
  for (const auto &[bytes, rank] : encoder_) {
    if (!decoder_.emplace(rank, bytes).second) {
      throw TokenizerError("Duplicate rank " + std::to_string(rank) + " in tokenizer " + name_);
    }
  }
  for (int byte = 0; byte < 256; ++byte) {
    const std::string single(1, static_cast<char>(byte));
    if (encoder_.find(single) == encoder_.end()) {
      throw TokenizerError("Tokenizer " + name_ + " has no rank for byte " + std::to_string(byte));
    }
  }
}

BpeTokenizer BpeTokenizer::from_file(const std::filesystem::path &rank_file) {
  std::ifstream file_stream(rank_file);
  if (!file_stream.is_open()) {
    throw TokenizerError("Could not open tokenizer rank file: " + rank_file.string());
  }

  std::unordered_map<std::string, Token> ranks;
  std::string line;
  size_t line_number = 0;
  while (std::getline(file_stream, line)) {
    ++line_number;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }

    const size_t separator = line.find(' ');
    if (separator == std::string::npos || separator == 0 || separator + 1 == line.size()) {
      throw TokenizerError("Malformed rank file line " + std::to_string(line_number) + " in " +
                           rank_file.string());
    }

    std::string token_bytes;
    unsigned long rank = 0;
    try {
      token_bytes = digest::base64_decode(line.substr(0, separator));
      size_t parsed = 0;
      const std::string rank_text = line.substr(separator + 1);
      rank = std::stoul(rank_text, &parsed);
      if (parsed != rank_text.size() || rank > std::numeric_limits<Token>::max()) {
        throw std::invalid_argument("trailing characters");
      }
    } catch (const std::exception &e) {
      throw TokenizerError("Malformed rank file line " + std::to_string(line_number) + " in " +
                           rank_file.string() + ": " + e.what());
    }

    if (!ranks.emplace(token_bytes, static_cast<Token>(rank)).second) {
      throw TokenizerError("Duplicate token on line " + std::to_string(line_number) + " in " +
                           rank_file.string());
    }
  }

  return BpeTokenizer(std::move(ranks), rank_file.stem().string());
}

std::vector<std::string> BpeTokenizer::split_pieces(const std::string &text) {
  std::string valid;
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));

  std::vector<uint32_t> cps;
  std::vector<size_t> offsets;
  for (auto it = valid.begin(); it != valid.end();) {
    offsets.push_back(static_cast<size_t>(it - valid.begin()));
    cps.push_back(utf8::next(it, valid.end()));
  }
  offsets.push_back(valid.size());

  std::vector<std::string> pieces;
  size_t i = 0;
  while (i < cps.size()) {
    const size_t end = next_piece_end(cps, i);
    pieces.push_back(valid.substr(offsets[i], offsets[end] - offsets[i]));
    i = end;
  }
  return pieces;
}

std::vector<Token> BpeTokenizer::encode(const std::string &text) const {
  std::vector<Token> tokens;
  for (const auto &piece : split_pieces(text)) {
    encode_piece(piece, tokens);
  }
  return tokens;
}

void BpeTokenizer::encode_piece(const std::string &piece, std::vector<Token> &out) const {
  if (auto it = encoder_.find(piece); it != encoder_.end()) {
    out.push_back(it->second);
    return;
  }

  // Boundaries of the current parts; part k is [bounds[k], bounds[k + 1])
  std::vector<size_t> bounds;
  for (size_t i = 0; i <= piece.size(); ++i) {
    bounds.push_back(i);
  }

  while (bounds.size() > 2) {
    Token best_rank = std::numeric_limits<Token>::max();
    size_t best_index = bounds.size();
    for (size_t k = 0; k + 2 < bounds.size(); ++k) {
      auto it = encoder_.find(piece.substr(bounds[k], bounds[k + 2] - bounds[k]));
      if (it != encoder_.end() && it->second < best_rank) {
        best_rank = it->second;
        best_index = k;
      }
    }
    if (best_index == bounds.size()) {
      break;
    }
    bounds.erase(bounds.begin() + static_cast<std::ptrdiff_t>(best_index) + 1);
  }

  for (size_t k = 0; k + 1 < bounds.size(); ++k) {
    out.push_back(encoder_.at(piece.substr(bounds[k], bounds[k + 1] - bounds[k])));
  }
}

std::string BpeTokenizer::decode(std::vector<Token>::const_iterator first,
                                 std::vector<Token>::const_iterator last) const {
  std::string raw;
  for (auto it = first; it != last; ++it) {
    auto found = decoder_.find(*it);
    if (found == decoder_.end()) {
      throw TokenizerError("Unknown token " + std::to_string(*it) + " for tokenizer " + name_);
    }
    raw += found->second;
  }

  std::string text;
  utf8::replace_invalid(raw.begin(), raw.end(), std::back_inserter(text));
  return text;
}

std::string BpeTokenizer::decode(const std::vector<Token> &tokens) const {
  return decode(tokens.begin(), tokens.end());
}

}  // namespace ragdesk_core

#include "ragdesk_core/llm/output_sanitizer.hpp"

#include <cctype>

namespace ragdesk_core {

namespace {

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

DelimitedBlockSanitizer::DelimitedBlockSanitizer(std::string open, std::string close)
    : open_(std::move(open)), close_(std::move(close)) {}

std::string DelimitedBlockSanitizer::sanitize(const std::string &raw) const {
  std::string out;
  size_t pos = 0;
  while (pos < raw.size()) {
    const size_t start = raw.find(open_, pos);
    if (start == std::string::npos) {
      break;
    }
    const size_t end = raw.find(close_, start + open_.size());
    if (end == std::string::npos) {
      break;
    }
    out.append(raw, pos, start - pos);
    pos = end + close_.size();
    while (pos < raw.size() && is_space(raw[pos])) {
      ++pos;
    }
  }
  if (pos < raw.size()) {
    out.append(raw, pos, std::string::npos);
  }

  size_t first = 0;
  while (first < out.size() && is_space(out[first])) {
    ++first;
  }
  size_t last = out.size();
  while (last > first && is_space(out[last - 1])) {
    --last;
  }
  return out.substr(first, last - first);
}

}  // namespace ragdesk_core

#pragma once

#include <memory>
#include <string>

namespace ragdesk_core {

// Post-processes raw generator output before it reaches the caller
class OutputSanitizer {
 public:
  virtual ~OutputSanitizer() = default;
  virtual std::string sanitize(const std::string &raw) const = 0;
};

class IdentitySanitizer : public OutputSanitizer {
 public:
  std::string sanitize(const std::string &raw) const override {
    return raw;
  }
};

/**
 * Removes every `open ... close` block (shortest match, case-sensitive) together
 * with the whitespace following it, then trims the result. An unterminated
 * block is kept as is. Defaults to the `<think>` reasoning blocks that
 * reasoning models emit ahead of their answer.
 */
class DelimitedBlockSanitizer : public OutputSanitizer {
 public:
  DelimitedBlockSanitizer(std::string open = "<think>", std::string close = "</think>");

  std::string sanitize(const std::string &raw) const override;

 private:
  std::string open_;
  std::string close_;
};

using OutputSanitizerPtr = std::shared_ptr<const OutputSanitizer>;

}  // namespace ragdesk_core

#pragma once

#include <stdexcept>
#include <string>

namespace ragdesk_core::digest {

class DigestError : public std::runtime_error {
 public:
  explicit DigestError(const std::string& message) : std::runtime_error(message) {}
};

// Lowercase hex SHA-256 of the given bytes
std::string sha256_hex(const std::string& content);

// Decodes standard (padded) base64. Throws DigestError on malformed input.
std::string base64_decode(const std::string& encoded);
std::string base64_encode(const std::string& raw);

}  // namespace ragdesk_core::digest

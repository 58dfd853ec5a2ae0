#include "ragdesk_core/util/digest.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <vector>

namespace ragdesk_core::digest {

std::string sha256_hex(const std::string& content) {
  EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw DigestError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw DigestError("Failed to initialize SHA256 digest");
  }

  if (EVP_DigestUpdate(mdctx, content.data(), content.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw DigestError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw DigestError("Failed to finalize SHA256 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }

  return ss.str();
}

std::string base64_decode(const std::string& encoded) {
  if (encoded.empty()) {
    return {};
  }
  if (encoded.size() % 4 != 0) {
    throw DigestError("Invalid base64 length: " + std::to_string(encoded.size()));
  }

  std::vector<unsigned char> out(encoded.size() / 4 * 3);
  const int decoded = EVP_DecodeBlock(out.data(),
                                      reinterpret_cast<const unsigned char*>(encoded.data()),
                                      static_cast<int>(encoded.size()));
  if (decoded < 0) {
    throw DigestError("Invalid base64 input: " + encoded);
  }

  // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
  size_t length = static_cast<size_t>(decoded);
  for (auto it = encoded.rbegin(); it != encoded.rend() && *it == '='; ++it) {
    --length;
  }
  return std::string(reinterpret_cast<const char*>(out.data()), length);
}

std::string base64_encode(const std::string& raw) {
  if (raw.empty()) {
    return {};
  }
  std::vector<unsigned char> out(4 * ((raw.size() + 2) / 3) + 1);
  const int written = EVP_EncodeBlock(out.data(),
                                      reinterpret_cast<const unsigned char*>(raw.data()),
                                      static_cast<int>(raw.size()));
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
}

}  // namespace ragdesk_core::digest

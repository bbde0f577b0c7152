#include "core/api_key.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <array>

namespace netvisor {

namespace {

std::string to_hex(const unsigned char *data, size_t len) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

}  // namespace

std::string generate_api_key() {
  std::array<unsigned char, 32> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    spdlog::error("RAND_bytes failed, cannot generate api key");
    return "";
  }
  return to_hex(bytes.data(), bytes.size());
}

std::string hash_api_key(const std::string &api_key) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  if (EVP_Digest(api_key.data(), api_key.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) != 1) {
    spdlog::error("EVP_Digest(sha256) failed");
    return "";
  }
  return to_hex(digest.data(), digest_len);
}

}  // namespace netvisor

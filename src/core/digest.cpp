#include "core/digest.hpp"

#include <array>
#include <cstdio>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace joule_gate::core {
namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* context) const {
    if (context != nullptr) {
      EVP_MD_CTX_free(context);
    }
  }
};

using DigestContextPtr = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

}  // namespace

std::string sha256_hex(const std::string_view data) {
  DigestContextPtr context(EVP_MD_CTX_new());
  if (context == nullptr) {
    throw std::runtime_error("sha256: unable to allocate digest context");
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(context.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(context.get(), digest.data(), &digest_len) != 1) {
    throw std::runtime_error("sha256: digest computation failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(static_cast<std::size_t>(digest_len) * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    out.push_back(kHex[digest[i] >> 4U]);
    out.push_back(kHex[digest[i] & 0x0FU]);
  }
  return out;
}

std::string sample_digest(const double timestamp, const double bucket_joules) {
  // %.17g round-trips a double, so both ends of the wire hash identical text.
  char buffer[64]{};
  std::snprintf(buffer, sizeof(buffer), "%.17g:%.17g", timestamp, bucket_joules);
  return sha256_hex(buffer);
}

}  // namespace joule_gate::core

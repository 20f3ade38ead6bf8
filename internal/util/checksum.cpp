#include "internal/util/checksum.hpp"

#include <openssl/evp.h>

#include <stdexcept>

#include "internal/util/uuid.hpp"

namespace entitystore::util {

namespace {

constexpr std::size_t kDerivedIdLength = 10;

std::string Digest(const EVP_MD* md, std::string_view content) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  length = 0;

  if (EVP_Digest(content.data(), content.size(), digest, &length, md, nullptr) != 1) {
    throw std::runtime_error("EVP_Digest failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    out.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    out.push_back(kHex[digest[i] & 0x0F]);
  }
  return out;
}

} // namespace

std::string Checksum(std::string_view content) {
  return Digest(EVP_md5(), content);
}

std::string DeriveId(std::string_view checksum) {
  return Digest(EVP_sha256(), checksum).substr(0, kDerivedIdLength);
}

const char* ToString(IdPolicy policy) {
  switch (policy) {
    case IdPolicy::kContentAddressed:
      return "content_addressed";
    case IdPolicy::kRandom:
      return "random";
  }
  return "unknown";
}

std::string IssueId(IdPolicy policy, std::string_view checksum) {
  if (policy == IdPolicy::kContentAddressed) {
    return DeriveId(checksum);
  }
  return GenerateId();
}

} // namespace entitystore::util

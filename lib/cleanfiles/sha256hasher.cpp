#include "sha256hasher.hpp"
#include "errors.hpp"

#include <array>
#include <memory>
#include <openssl/evp.h> // EVP_* digest API

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

std::string toHex(const unsigned char *data, unsigned int len) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5',
                                                '6', '7', '8', '9', 'a', 'b',
                                                'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(2 * static_cast<std::size_t>(len));
  for (unsigned int i = 0; i < len; ++i) {
    unsigned b = data[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

} // namespace

std::string
Sha256Hasher::calculateHash(const std::filesystem::path &filePath) const {
  DigestContext ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw HashError("EVP_MD_CTX_new failed");
  }

  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw HashError("EVP_DigestInit_ex(EVP_sha256) failed");
  }

  m_fs.readBytes(filePath, [&ctx, &filePath](const char *data,
                                             std::size_t size) {
    if (EVP_DigestUpdate(ctx.get(), data, size) != 1) {
      throw HashError("EVP_DigestUpdate failed for " + filePath.string());
    }
  });

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1) {
    throw HashError("EVP_DigestFinal_ex failed for " + filePath.string());
  }
  if (len != 32) {
    throw HashError("SHA-256 produced unexpected length");
  }

  return toHex(digest.data(), len);
}

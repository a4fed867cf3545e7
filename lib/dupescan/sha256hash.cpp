#include "sha256hash.hpp"

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

#include <openssl/evp.h>

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

std::string Sha256Hash::calculateHash(const std::string &filePath) const {
  std::ifstream file(filePath, std::ios::binary);
  if (!file)
    return "";

  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
    return "";

  std::vector<char> buffer(1024 * 1024);
  while (file) {
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize got = file.gcount();
    if (got > 0 &&
        EVP_DigestUpdate(ctx.get(), buffer.data(),
                         static_cast<std::size_t>(got)) != 1) {
      return "";
    }
  }
  if (file.bad())
    return "";

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digestLen = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1)
    return "";

  std::stringstream ss;
  for (unsigned int i = 0; i < digestLen; ++i) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(digest[i]);
  }
  return ss.str();
}

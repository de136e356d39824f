#include "hash.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace jobclaim::util {
namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

const EVP_MD* ResolveDigest(std::string_view algorithm) {
  const std::string name(algorithm);
  const EVP_MD*     md = EVP_get_digestbyname(name.c_str());
  if (!md) {
    throw std::invalid_argument("unknown digest algorithm: " + name);
  }
  return md;
}

MdCtx BeginDigest(const EVP_MD* md) {
  MdCtx ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  return ctx;
}

std::string FinishDigest(EVP_MD_CTX* ctx) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  length = 0;
  if (EVP_DigestFinal_ex(ctx, digest, &length) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
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

std::string HexDigest(std::string_view algorithm, std::string_view data) {
  auto ctx = BeginDigest(ResolveDigest(algorithm));
  if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  return FinishDigest(ctx.get());
}

std::string Sha256File(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open file for hashing: " + path);
  }

  auto              ctx = BeginDigest(EVP_sha256());
  std::vector<char> buffer(64 * 1024);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto got = in.gcount();
    if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }
  return FinishDigest(ctx.get());
}

} // namespace jobclaim::util

#include "cleanroom/hash.hpp"

#include "cleanroom/consts.hpp"
#include "cleanroom/errors.hpp"

#include <memory>
#include <openssl/evp.h> // EVP_* digest API

namespace cleanroom {

namespace {

struct MdCtxFree {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxFree>;

int nibble(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F')
    return 10 + (c - 'A');
  return -1;
}

} // namespace

oid sha1(std::span<const std::uint8_t> data) {
  const MdCtxPtr ctx{EVP_MD_CTX_new()};
  if (!ctx)
    throw Error("EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1)
    throw Error("EVP_DigestInit_ex(EVP_sha1) failed");
  if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
    throw Error("EVP_DigestUpdate failed");

  oid out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1)
    throw Error("EVP_DigestFinal_ex failed");
  if (len != out.size())
    throw Error("SHA-1 produced unexpected length");
  return out;
}

std::string to_hex(const oid &id) {
  static constexpr std::string_view kHex = "0123456789abcdef";
  std::string s(consts::kOidHexLen, '0');
  for (std::size_t i = 0; i < consts::kOidRawLen; ++i) {
    s[2 * i] = kHex[(id[i] >> 4) & 0xF];
    s[2 * i + 1] = kHex[id[i] & 0xF];
  }
  return s;
}

bool from_hex(std::string_view hex, oid &out) {
  if (hex.size() != consts::kOidHexLen)
    return false;
  for (std::size_t i = 0; i < consts::kOidRawLen; ++i) {
    const int hi = nibble(hex[2 * i]);
    const int lo = nibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0)
      return false;
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return true;
}

} // namespace cleanroom

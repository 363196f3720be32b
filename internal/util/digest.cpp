#include "digest.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace vault::util {

void Md5::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
  EVP_MD_CTX_free(ctx);
}

Md5::Md5() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) throw std::runtime_error("md5: failed to create digest context");
  if (!EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr)) {
    throw std::runtime_error("md5: failed to initialize digest");
  }
}

Md5::~Md5()                         = default;
Md5::Md5(Md5&&) noexcept            = default;
Md5& Md5::operator=(Md5&&) noexcept = default;

void Md5::Update(const void* data, size_t size) {
  if (!ctx_) throw std::runtime_error("md5: digest already finished");
  if (size == 0) return;
  if (!EVP_DigestUpdate(ctx_.get(), data, size)) {
    throw std::runtime_error("md5: digest update failed");
  }
}

std::string Md5::Finish() {
  if (!ctx_) throw std::runtime_error("md5: digest already finished");

  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int  len = 0;
  if (!EVP_DigestFinal_ex(ctx_.get(), out, &len)) {
    throw std::runtime_error("md5: digest finalization failed");
  }
  ctx_.reset();
  return std::string(reinterpret_cast<const char*>(out), len);
}

std::string Md5::Digest(std::string_view data) {
  Md5 md5;
  md5.Update(data);
  return md5.Finish();
}

std::string HmacSha256(std::string_view key, std::string_view data) {
  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int  len = 0;

  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), reinterpret_cast<const unsigned char*>(data.data()), data.size(), out,
            &len)) {
    throw std::runtime_error("hmac-sha256 failed");
  }
  return std::string(reinterpret_cast<const char*>(out), len);
}

std::string ToHex(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(bytes.size() * 2);
  for (char c : bytes) {
    const auto b = static_cast<unsigned char>(c);
    result.push_back(kHex[b >> 4]);
    result.push_back(kHex[b & 0x0F]);
  }
  return result;
}

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

std::string FromHex(std::string_view hex) {
  if (hex.size() % 2 != 0) throw InvalidArgument("hex string has odd length");

  std::string bytes(hex.size() / 2, '\0');
  for (size_t i = 0; i < bytes.size(); ++i) {
    const int hi = HexNibble(hex[2 * i]);
    const int lo = HexNibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) throw InvalidArgument("hex string contains non-hex character");
    bytes[i] = static_cast<char>((hi << 4) | lo);
  }
  return bytes;
}

std::string RandomBytes(size_t count) {
  std::string out(count, '\0');
  if (count > 0 && RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), static_cast<int>(count)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

bool ConstantTimeEquals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string MultipartEtag(const std::string* part_etags, size_t count) {
  Md5 md5;
  for (size_t i = 0; i < count; ++i) {
    md5.Update(FromHex(part_etags[i]));
  }
  return ToHex(md5.Finish()) + "-" + std::to_string(count);
}

} // namespace vault::util

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace vault::util {

/*
  Incremental MD5 over OpenSSL EVP.

  Used for S3-style ETags: a single object's ETag is the hex MD5 of its bytes,
  a multipart object's ETag is MD5(concat(binary part MD5s)) + "-N".
*/
class Md5 {
 public:
  Md5();
  ~Md5();

  Md5(const Md5&)            = delete;
  Md5& operator=(const Md5&) = delete;
  Md5(Md5&&) noexcept;
  Md5& operator=(Md5&&) noexcept;

  void Update(const void* data, size_t size);
  void Update(std::string_view data) {
    Update(data.data(), data.size());
  }

  // 16 raw digest bytes; the object cannot be updated afterwards
  std::string Finish();

  static std::string Digest(std::string_view data);

 private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st* ctx) const;
  };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

std::string HmacSha256(std::string_view key, std::string_view data);

std::string ToHex(std::string_view bytes);
std::string FromHex(std::string_view hex);

std::string RandomBytes(size_t count);

bool ConstantTimeEquals(std::string_view a, std::string_view b);

// ETag of a multipart object given the hex ETags of its parts, in part order
std::string MultipartEtag(const std::string* part_etags, size_t count);

} // namespace vault::util

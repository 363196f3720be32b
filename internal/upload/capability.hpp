#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace vault::upload {

struct CapabilityClaims {
  std::string session_id;
  uint32_t    part_number   = 0;
  uint64_t    expires_at_ms = 0;
  std::string nonce; // hex, unique per issued capability
};

/*
  Signed part-write capability.

      <base_url>/<session_id>/parts/<n>?expires=<unix ms>&nonce=<hex>&signature=<hex>

  signature = hex(HMAC-SHA256(secret, "<session_id>\n<n>\n<expires>\n<nonce>"))

  A capability names exactly one session and one part; any change to the
  URL breaks the signature. Single use is enforced by the session manager
  through the nonce.
*/
class CapabilitySigner {
 public:
  CapabilitySigner(std::string secret, std::string base_url);

  std::string Issue(const CapabilityClaims& claims) const;

  // util::InvalidArgument for malformed or tampered URLs,
  // util::SessionExpiredError(kCapability) once expires has passed.
  CapabilityClaims Verify(const std::string& url, util::TimePoint now) const;

  // 16 random bytes, hex encoded
  static std::string NewNonce();

 private:
  std::string Sign(const CapabilityClaims& claims) const;

  std::string secret_;
  std::string base_url_;
};

} // namespace vault::upload

#include "capability.hpp"

#include <charconv>
#include <string_view>

#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"

namespace vault::upload {

namespace {

template <typename T>
bool ParseNumber(std::string_view text, T& out) {
  if (text.empty()) return false;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

std::string_view QueryValue(std::string_view query, std::string_view name) {
  size_t start = 0;
  while (start <= query.size()) {
    auto end = query.find('&', start);
    if (end == std::string_view::npos) end = query.size();
    auto pair = query.substr(start, end - start);
    auto eq   = pair.find('=');
    if (eq != std::string_view::npos && pair.substr(0, eq) == name) {
      return pair.substr(eq + 1);
    }
    start = end + 1;
  }
  return {};
}

} // namespace

CapabilitySigner::CapabilitySigner(std::string secret, std::string base_url) : secret_(std::move(secret)), base_url_(std::move(base_url)) {
  if (secret_.empty()) {
    throw util::InvalidArgument("capability secret must not be empty");
  }
  while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::string CapabilitySigner::Sign(const CapabilityClaims& claims) const {
  const auto payload = claims.session_id + "\n" + std::to_string(claims.part_number) + "\n" + std::to_string(claims.expires_at_ms) +
                       "\n" + claims.nonce;
  return util::ToHex(util::HmacSha256(secret_, payload));
}

std::string CapabilitySigner::NewNonce() {
  return util::ToHex(util::RandomBytes(16));
}

std::string CapabilitySigner::Issue(const CapabilityClaims& claims) const {
  return base_url_ + "/" + claims.session_id + "/parts/" + std::to_string(claims.part_number) +
         "?expires=" + std::to_string(claims.expires_at_ms) + "&nonce=" + claims.nonce + "&signature=" + Sign(claims);
}

CapabilityClaims CapabilitySigner::Verify(const std::string& url, util::TimePoint now) const {
  std::string_view view(url);
  const auto       prefix = base_url_ + "/";
  if (view.substr(0, prefix.size()) != prefix) {
    throw util::InvalidArgument("capability url does not belong to this service");
  }
  view.remove_prefix(prefix.size());

  const auto query_pos = view.find('?');
  if (query_pos == std::string_view::npos) {
    throw util::InvalidArgument("malformed capability url");
  }
  const auto path  = view.substr(0, query_pos);
  const auto query = view.substr(query_pos + 1);

  const auto marker = path.find("/parts/");
  if (marker == std::string_view::npos || marker == 0) {
    throw util::InvalidArgument("malformed capability url");
  }

  CapabilityClaims claims;
  claims.session_id = std::string(path.substr(0, marker));
  claims.nonce      = std::string(QueryValue(query, "nonce"));
  const auto sig    = QueryValue(query, "signature");

  if (!ParseNumber(path.substr(marker + 7), claims.part_number) || claims.part_number == 0 ||
      !ParseNumber(QueryValue(query, "expires"), claims.expires_at_ms) || claims.nonce.empty() || sig.empty()) {
    throw util::InvalidArgument("malformed capability url");
  }

  if (!util::ConstantTimeEquals(Sign(claims), sig)) {
    throw util::InvalidArgument("capability signature mismatch");
  }

  if (util::ToUnixMillis(now) >= claims.expires_at_ms) {
    throw util::SessionExpiredError(util::SessionExpiredError::Scope::kCapability,
                                    "capability for part " + std::to_string(claims.part_number) + " expired");
  }
  return claims;
}

} // namespace vault::upload

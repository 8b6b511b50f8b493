#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "internal/auth/canonical.hpp"
#include "internal/auth/request.hpp"

namespace fmd::auth {

/*
  HAWK-style request signing (header scheme only, HMAC-SHA256).

      Authorization: Hawk id="..", ts="..", nonce="..", ext="..", hash="..", mac=".."

  Verification recomputes path, host and port from the live request and
  the payload hash from the live body; only id, ts, nonce and ext are
  taken from the header. Nonce replay protection is the caller's job
  (NonceStore), the authenticator holds no state.
*/

struct HawkOptions {
  bool override_port = false;
  bool show_hash     = false;
};

struct HawkCredentials {
  std::string id;
  std::string ts;
  std::string nonce;
  std::string ext;
  std::string hash;
  std::string mac;
};

// Throws util::Error(NoAuth) for an empty header and
// util::Error(NotHawkAuth) when the scheme is not "Hawk" (any case).
HawkCredentials ParseAuthorization(std::string_view header);

// Values are written verbatim; they must not contain '"'.
std::string RenderAuthorization(const HawkCredentials& credentials);

// base64 of `bytes` random bytes.
std::string GenerateNonce(std::size_t bytes = 6);

// Equality after stripping trailing '=' padding, constant time.
bool CompareMac(std::string_view claimed, std::string_view expected);

class HawkAuthenticator {
 public:
  explicit HawkAuthenticator(HawkOptions options = {});

  // Outbound. ts / nonce are generated when empty.
  HawkCredentials Sign(const RequestInfo& request, const std::string& id, std::string_view body, const std::string& extra,
                       std::string_view secret, std::string ts = {}, std::string nonce = {}) const;

  std::string AsHeader(const RequestInfo& request, const std::string& id, std::string_view body, const std::string& extra,
                       std::string_view secret) const;

  // Inbound. Parses request.authorization.
  HawkCredentials Parse(const RequestInfo& request) const;

  // Throws util::Error(InvalidSignature) on MAC mismatch.
  void Verify(const RequestInfo& request, const HawkCredentials& claimed, std::string_view body, std::string_view secret) const;

  // Parse + Verify.
  HawkCredentials Verify(const RequestInfo& request, std::string_view body, std::string_view secret) const;

  std::string ComputeMac(const CanonicalInput& input, std::string_view secret) const;

 private:
  CanonicalInput BuildInput(const RequestInfo& request, std::string_view body, std::string ts, std::string nonce, std::string extra) const;

  HawkOptions options_;
};

} // namespace fmd::auth

#pragma once

#include <string>
#include <string_view>

#include "internal/auth/request.hpp"

namespace fmd::auth {

/*
  Canonicalizer + payload hasher.

  Pure functions; every step returns a value instead of filling in a
  shared authenticator object:

      ResolveHostPort / FullPath  -> CanonicalInput
      PayloadHash(type, body)     -> CanonicalInput::hash
      CanonicalString(input)      -> string fed into the MAC
*/

struct HostPort {
  std::string host;
  std::string port;
};

struct CanonicalInput {
  std::string ts;
  std::string nonce;
  std::string method;
  std::string path;
  std::string host;
  std::string port;
  std::string hash;
  std::string extra;
};

// path + "?" + query + "#" + fragment, separators only when the part is non-empty.
std::string FullPath(const RequestInfo& request);

// Splits the Host header. A port is taken only from "host:digits" or
// "[v6]:digits"; anything else keeps the text before the first ':' as host.
// Without an explicit port (or with override_port) the port is derived from
// the scheme: 443 for https, 80 otherwise.
HostPort ResolveHostPort(const RequestInfo& request, bool override_port);

// Strips any ";charset=..." style suffix. Empty means "text/plain".
std::string NormalizeContentType(std::string_view content_type);

// '\' -> "\\" and newline -> "\n" literal.
std::string EscapeBody(std::string_view body);

std::string PayloadHashInput(std::string_view content_type, std::string_view body);

// base64(SHA-256(PayloadHashInput(...)))
std::string PayloadHash(std::string_view content_type, std::string_view body);

std::string CanonicalString(const CanonicalInput& input);

} // namespace fmd::auth

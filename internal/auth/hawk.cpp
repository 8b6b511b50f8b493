#include "hawk.hpp"

#include <cctype>
#include <ctime>

#include "internal/observability/logging.hpp"
#include "internal/util/crypto.hpp"
#include "internal/util/errors.hpp"

namespace fmd::auth {

using fmd::util::Error;
using fmd::util::ErrorKind;

namespace {

constexpr std::string_view kScheme = "hawk";

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string LowerCopy(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

std::string_view TrimPadding(std::string_view s) {
  while (!s.empty() && s.back() == '=') s.remove_suffix(1);
  return s;
}

} // namespace

HawkCredentials ParseAuthorization(std::string_view header) {
  if (header.empty()) {
    throw Error(ErrorKind::NoAuth, "No Authorization Header");
  }
  if (header.size() < kScheme.size() || LowerCopy(header.substr(0, kScheme.size())) != kScheme ||
      (header.size() > kScheme.size() && !IsSpace(header[kScheme.size()]))) {
    throw Error(ErrorKind::NotHawkAuth, "Not a Hawk Authorization Header");
  }

  HawkCredentials out;
  std::size_t     i = kScheme.size();
  const auto      n = header.size();

  while (i < n) {
    while (i < n && (IsSpace(header[i]) || header[i] == ',')) ++i;
    if (i >= n) break;

    const auto key_start = i;
    while (i < n && header[i] != '=' && header[i] != ',') ++i;
    if (i >= n || header[i] == ',') {
      continue;  // bare token, no value
    }
    std::string key = LowerCopy(header.substr(key_start, i - key_start));
    while (!key.empty() && IsSpace(key.back())) key.pop_back();
    ++i;  // '='

    std::string value;
    if (i < n && header[i] == '"') {
      const auto close = header.find('"', i + 1);
      const auto end   = close == std::string_view::npos ? n : close;
      value            = std::string(header.substr(i + 1, end - i - 1));
      i                = end == n ? n : end + 1;
    } else {
      const auto value_start = i;
      while (i < n && header[i] != ',') ++i;
      value = std::string(header.substr(value_start, i - value_start));
      while (!value.empty() && IsSpace(value.back())) value.pop_back();
    }

    if (key == "id") {
      out.id = std::move(value);
    } else if (key == "ts") {
      out.ts = std::move(value);
    } else if (key == "nonce") {
      out.nonce = std::move(value);
    } else if (key == "ext") {
      out.ext = std::move(value);
    } else if (key == "hash") {
      out.hash = std::move(value);
    } else if (key == "mac") {
      out.mac = std::move(value);
    }
  }
  return out;
}

std::string RenderAuthorization(const HawkCredentials& c) {
  return "Hawk id=\"" + c.id + "\", ts=\"" + c.ts + "\", nonce=\"" + c.nonce + "\", ext=\"" + c.ext + "\", hash=\"" + c.hash + "\", mac=\"" +
         c.mac + "\"";
}

std::string GenerateNonce(std::size_t bytes) {
  return util::Base64Encode(util::RandomBytes(bytes == 0 ? 6 : bytes));
}

bool CompareMac(std::string_view claimed, std::string_view expected) {
  return util::ConstantTimeEquals(TrimPadding(claimed), TrimPadding(expected));
}

HawkAuthenticator::HawkAuthenticator(HawkOptions options) : options_(options) {
}

CanonicalInput HawkAuthenticator::BuildInput(const RequestInfo& request, std::string_view body, std::string ts, std::string nonce,
                                             std::string extra) const {
  auto host_port = ResolveHostPort(request, options_.override_port);

  CanonicalInput input;
  input.ts     = std::move(ts);
  input.nonce  = std::move(nonce);
  input.method = request.method;
  input.path   = FullPath(request);
  input.host   = std::move(host_port.host);
  input.port   = std::move(host_port.port);
  input.hash   = PayloadHash(request.content_type, body);
  input.extra  = std::move(extra);

  if (options_.show_hash) {
    FMD_LOG_DEBUG("hawk", "genHash",
                  {observability::StringField("marshalStr", PayloadHashInput(request.content_type, body)), observability::StringField("hash", input.hash)});
  }
  return input;
}

std::string HawkAuthenticator::ComputeMac(const CanonicalInput& input, std::string_view secret) const {
  const auto canonical = CanonicalString(input);
  if (options_.show_hash) {
    FMD_LOG_DEBUG("hawk", "Marshal", {observability::StringField("marshalStr", canonical)});
  }
  return util::Base64Encode(util::HmacSha256(secret, canonical));
}

HawkCredentials HawkAuthenticator::Sign(const RequestInfo& request, const std::string& id, std::string_view body, const std::string& extra,
                                        std::string_view secret, std::string ts, std::string nonce) const {
  if (nonce.empty()) {
    nonce = GenerateNonce();
  }
  if (ts.empty()) {
    ts = std::to_string(static_cast<long long>(std::time(nullptr)));
  }

  const auto input = BuildInput(request, body, ts, nonce, extra);

  HawkCredentials out;
  out.id    = id;
  out.ts    = input.ts;
  out.nonce = input.nonce;
  out.ext   = input.extra;
  out.hash  = input.hash;
  out.mac   = ComputeMac(input, secret);
  return out;
}

std::string HawkAuthenticator::AsHeader(const RequestInfo& request, const std::string& id, std::string_view body, const std::string& extra,
                                        std::string_view secret) const {
  return RenderAuthorization(Sign(request, id, body, extra, secret));
}

HawkCredentials HawkAuthenticator::Parse(const RequestInfo& request) const {
  return ParseAuthorization(request.authorization);
}

void HawkAuthenticator::Verify(const RequestInfo& request, const HawkCredentials& claimed, std::string_view body, std::string_view secret) const {
  const auto input    = BuildInput(request, body, claimed.ts, claimed.nonce, claimed.ext);
  const auto expected = ComputeMac(input, secret);

  if (claimed.mac.empty() || !CompareMac(claimed.mac, expected)) {
    throw Error(ErrorKind::InvalidSignature, "Header does not match signature", "hawk_verify", claimed.id);
  }
}

HawkCredentials HawkAuthenticator::Verify(const RequestInfo& request, std::string_view body, std::string_view secret) const {
  auto claimed = Parse(request);
  Verify(request, claimed, body, secret);
  return claimed;
}

} // namespace fmd::auth

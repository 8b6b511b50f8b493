#include "internal/auth/canonical.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using fmd::auth::CanonicalInput;
using fmd::auth::RequestInfo;

RequestInfo Request(std::string scheme, std::string host) {
  RequestInfo r;
  r.method = "post";
  r.scheme = std::move(scheme);
  r.host   = std::move(host);
  r.path   = "/cmd";
  return r;
}

void TestFullPathJoinsOnlyNonEmptyParts() {
  RequestInfo r = Request("https", "example.com");
  assert(fmd::auth::FullPath(r) == "/cmd");

  r.query = "a=1&b=2";
  assert(fmd::auth::FullPath(r) == "/cmd?a=1&b=2");

  r.fragment = "top";
  assert(fmd::auth::FullPath(r) == "/cmd?a=1&b=2#top");

  r.query.clear();
  assert(fmd::auth::FullPath(r) == "/cmd#top");
}

void TestHostPortDefaultsFromScheme() {
  auto hp = fmd::auth::ResolveHostPort(Request("https", "example.com"), false);
  assert(hp.host == "example.com");
  assert(hp.port == "443");

  hp = fmd::auth::ResolveHostPort(Request("http", "example.com"), false);
  assert(hp.port == "80");

  hp = fmd::auth::ResolveHostPort(Request("HTTPS", "example.com"), false);
  assert(hp.port == "443");
}

void TestExplicitPortKeptUnlessOverridden() {
  auto hp = fmd::auth::ResolveHostPort(Request("https", "example.com:8443"), false);
  assert(hp.host == "example.com");
  assert(hp.port == "8443");

  hp = fmd::auth::ResolveHostPort(Request("https", "example.com:8443"), true);
  assert(hp.host == "example.com");
  assert(hp.port == "443");
}

void TestMalformedHostFallsBackToSchemePort() {
  auto hp = fmd::auth::ResolveHostPort(Request("https", "example.com:443:8080"), false);
  assert(hp.host == "example.com");
  assert(hp.port == "443");

  hp = fmd::auth::ResolveHostPort(Request("http", "example.com:abc"), false);
  assert(hp.host == "example.com");
  assert(hp.port == "80");

  hp = fmd::auth::ResolveHostPort(Request("http", "example.com:"), false);
  assert(hp.port == "80");
}

void TestBracketedIpv6Host() {
  auto hp = fmd::auth::ResolveHostPort(Request("https", "[::1]:8443"), false);
  assert(hp.host == "[::1]");
  assert(hp.port == "8443");

  hp = fmd::auth::ResolveHostPort(Request("https", "[::1]"), false);
  assert(hp.host == "[::1]");
  assert(hp.port == "443");

  hp = fmd::auth::ResolveHostPort(Request("https", "[::1]:8443"), true);
  assert(hp.port == "443");
}

void TestContentTypeNormalization() {
  assert(fmd::auth::NormalizeContentType("") == "text/plain");
  assert(fmd::auth::NormalizeContentType("application/json") == "application/json");
  assert(fmd::auth::NormalizeContentType("application/json; charset=utf-8") == "application/json");
}

void TestBodyEscaping() {
  assert(fmd::auth::EscapeBody("plain") == "plain");
  assert(fmd::auth::EscapeBody("a\\b") == "a\\\\b");
  assert(fmd::auth::EscapeBody("a\nb") == "a\\nb");
  assert(fmd::auth::EscapeBody("\r\t") == "\r\t");
}

void TestPayloadHashKnownValues() {
  assert(fmd::auth::PayloadHashInput("application/json", "{\"op\":\"lock\"}") == "hawk.1.payload\napplication/json\n{\"op\":\"lock\"}\n");

  assert(fmd::auth::PayloadHash("application/json", "{\"op\":\"lock\"}") == "izN//SuUV+UoCPPujsrh/+2gmoHcuNFfJ17AYnnGpCk=");
  assert(fmd::auth::PayloadHash("", "") == "q/t+NNAkQZNlq/aAD6PlexImwQTxwgT2MahfTa9XRLA=");
  assert(fmd::auth::PayloadHash("text/plain", "a\\b\nc") == "ZP3R/mDkf7CQ6OWelxVC5dTd84Ry0dK05rU4qhEtizI=");
}

void TestPayloadHashIgnoresCharset() {
  const std::string body = "{\"op\":\"ring\"}";
  assert(fmd::auth::PayloadHash("application/json", body) == fmd::auth::PayloadHash("application/json;charset=utf-8", body));
  assert(fmd::auth::PayloadHash("", body) == fmd::auth::PayloadHash("text/plain", body));
  assert(fmd::auth::PayloadHash("application/json", body) != fmd::auth::PayloadHash("text/plain", body));
}

void TestCanonicalStringLayout() {
  CanonicalInput in;
  in.ts     = "1700000000";
  in.nonce  = "abc123";
  in.method = "post";
  in.path   = "/cmd";
  in.host   = "Example.COM";
  in.port   = "443";
  in.hash   = "H";
  in.extra  = "";

  assert(fmd::auth::CanonicalString(in) == "hawk.1.header\n1700000000\nabc123\nPOST\n/cmd\nexample.com\n443\nH\n\n");
}

} // namespace

int main() {
  TestFullPathJoinsOnlyNonEmptyParts();
  TestHostPortDefaultsFromScheme();
  TestExplicitPortKeptUnlessOverridden();
  TestMalformedHostFallsBackToSchemePort();
  TestBracketedIpv6Host();
  TestContentTypeNormalization();
  TestBodyEscaping();
  TestPayloadHashKnownValues();
  TestPayloadHashIgnoresCharset();
  TestCanonicalStringLayout();

  std::cout << "fmd_unit_canonical: pass\n";
  return 0;
}

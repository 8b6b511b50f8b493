#pragma once

#include <string>

namespace fmd::auth {

/*
  The parts of an HTTP request that take part in signing.

  Filled in by whoever owns the HTTP layer; the auth code never parses
  raw requests itself.
*/
struct RequestInfo {
  std::string method;
  std::string scheme;  // "https" or "http"
  std::string host;    // Host header value, optionally "host:port"
  std::string path;
  std::string query;     // without leading '?'
  std::string fragment;  // without leading '#'
  std::string content_type;
  std::string authorization;
};

} // namespace fmd::auth

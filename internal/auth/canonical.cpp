#include "canonical.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/crypto.hpp"

namespace fmd::auth {

namespace {

std::string Upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool IsDigits(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

std::string FullPath(const RequestInfo& request) {
  std::string path = request.path;
  if (!request.query.empty()) {
    path += "?" + request.query;
  }
  if (!request.fragment.empty()) {
    path += "#" + request.fragment;
  }
  return path;
}

HostPort ResolveHostPort(const RequestInfo& request, bool override_port) {
  HostPort out;

  const std::string& host = request.host;
  if (!host.empty() && host.front() == '[') {
    const auto close = host.find(']');
    out.host         = host.substr(0, close == std::string::npos ? host.size() : close + 1);
    if (close != std::string::npos && close + 1 < host.size() && host[close + 1] == ':') {
      out.port = host.substr(close + 2);
    }
  } else {
    const auto colon = host.find(':');
    out.host         = host.substr(0, colon);
    if (colon != std::string::npos && host.find(':', colon + 1) == std::string::npos) {
      out.port = host.substr(colon + 1);
    }
  }
  if (!IsDigits(out.port)) {
    out.port.clear();
  }

  // reverse proxies rewrite the port, so it may not be taken at face value
  if (out.port.empty() || override_port) {
    out.port = Lower(request.scheme) == "https" ? "443" : "80";
  }
  return out;
}

std::string NormalizeContentType(std::string_view content_type) {
  if (content_type.empty()) {
    return "text/plain";
  }
  return std::string(content_type.substr(0, content_type.find(';')));
}

std::string EscapeBody(std::string_view body) {
  std::string out;
  out.reserve(body.size());
  for (char c : body) {
    if (c == '\\') {
      out += "\\\\";
    } else if (c == '\n') {
      out += "\\n";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string PayloadHashInput(std::string_view content_type, std::string_view body) {
  return "hawk.1.payload\n" + NormalizeContentType(content_type) + "\n" + EscapeBody(body) + "\n";
}

std::string PayloadHash(std::string_view content_type, std::string_view body) {
  return util::Base64Encode(util::Sha256(PayloadHashInput(content_type, body)));
}

std::string CanonicalString(const CanonicalInput& input) {
  std::string out = "hawk.1.header\n";
  out += input.ts + "\n";
  out += input.nonce + "\n";
  out += Upper(input.method) + "\n";
  out += input.path + "\n";
  out += Lower(input.host) + "\n";
  out += input.port + "\n";
  out += input.hash + "\n";
  out += input.extra + "\n";
  return out;
}

} // namespace fmd::auth

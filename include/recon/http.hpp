/**
 * @file http.hpp
 * @brief Control-plane endpoint parsing and the request/response values
 *        exchanged with an HttpTransport.
 *
 * Endpoints: "unix:/path", "http://host[:port]", "https://host[:port]".
 */

#ifndef RECON_HTTP_HPP_
#define RECON_HTTP_HPP_

#include "recon/vocabulary.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace recon {
namespace http {

// ============================================================================
// Endpoint
// ============================================================================

enum class Scheme : uint8_t {
  kUnix = 0,
  kHttp,
  kHttps,
};

struct Endpoint {
  Scheme scheme = Scheme::kUnix;
  std::string socket_path;  ///< kUnix only.
  std::string host;         ///< kHttp / kHttps.
  uint16_t port = 0;
};

static constexpr uint16_t kDefaultHttpsPort = 8443;
static constexpr uint16_t kDefaultHttpPort = 80;

inline Result<Endpoint> ParseEndpoint(const std::string& url) {
  Endpoint ep;
  static const std::string kUnix = "unix:";
  static const std::string kHttp = "http://";
  static const std::string kHttps = "https://";

  if (url.compare(0, kUnix.size(), kUnix) == 0) {
    ep.scheme = Scheme::kUnix;
    ep.socket_path = url.substr(kUnix.size());
    if (ep.socket_path.empty()) {
      return Result<Endpoint>::error(
          MakeError(ErrorKind::kSettings, "empty unix socket path in " + url));
    }
    return Result<Endpoint>::success(std::move(ep));
  }

  std::string rest;
  if (url.compare(0, kHttps.size(), kHttps) == 0) {
    ep.scheme = Scheme::kHttps;
    ep.port = kDefaultHttpsPort;
    rest = url.substr(kHttps.size());
  } else if (url.compare(0, kHttp.size(), kHttp) == 0) {
    ep.scheme = Scheme::kHttp;
    ep.port = kDefaultHttpPort;
    rest = url.substr(kHttp.size());
  } else {
    return Result<Endpoint>::error(
        MakeError(ErrorKind::kSettings, "unsupported endpoint url: " + url));
  }

  std::string::size_type slash = rest.find('/');
  if (slash != std::string::npos) rest.resize(slash);

  std::string::size_type colon = rest.rfind(':');
  if (colon != std::string::npos && rest.find(']') == std::string::npos) {
    std::string port_str = rest.substr(colon + 1);
    char* end = nullptr;
    long port = std::strtol(port_str.c_str(), &end, 10);
    if (port_str.empty() || *end != '\0' || port <= 0 || port > 65535) {
      return Result<Endpoint>::error(
          MakeError(ErrorKind::kSettings, "invalid port in " + url));
    }
    ep.port = static_cast<uint16_t>(port);
    rest.resize(colon);
  }
  if (rest.empty()) {
    return Result<Endpoint>::error(
        MakeError(ErrorKind::kSettings, "missing host in " + url));
  }
  ep.host = rest;
  return Result<Endpoint>::success(std::move(ep));
}

/** Percent-encode a path segment or query value (RFC 3986 unreserved kept). */
inline std::string UrlEncode(const std::string& in) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(in.size());
  for (unsigned char c : in) {
    if (std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

// ============================================================================
// Request / Response
// ============================================================================

struct Request {
  std::string method;
  std::string path;  ///< Origin form, query included.
  std::string body;  ///< Empty = no body.
};

struct Response {
  int32_t status = 0;
  std::string body;
};

/** URL prefix a transport puts in front of Request::path. */
inline std::string BaseUrl(const Endpoint& ep) {
  switch (ep.scheme) {
    case Scheme::kUnix:
      return "http://localhost";
    case Scheme::kHttp:
      return "http://" + ep.host + ":" + std::to_string(ep.port);
    case Scheme::kHttps:
      return "https://" + ep.host + ":" + std::to_string(ep.port);
  }
  return std::string();
}

}  // namespace http
}  // namespace recon

#endif  // RECON_HTTP_HPP_

#pragma once

#include <string>

namespace callgate {
namespace engine {
namespace common {

// Parsed HTTP(S) URL components
struct ParsedUrl {
  bool tls = true;
  std::string host;
  std::string port;
  std::string path;  // Never ends with '/', empty for the root
};

// Parse "https://my-shop.myshopify.com" or "http://127.0.0.1:8080/admin"
//   -> tls, host, port (443 / 80 when omitted), base path without trailing '/'
//
// A URL without a scheme is treated as https host[:port][/path].
// Throws std::invalid_argument for an unsupported scheme or an empty host.
ParsedUrl ParseHttpUrl(const std::string& url);

}  // namespace common
}  // namespace engine
}  // namespace callgate

#include "util.hpp"
#include <stdexcept>

namespace callgate {
namespace engine {
namespace common {

ParsedUrl ParseHttpUrl(const std::string& url) {
  ParsedUrl result;
  std::string rest = url;

  size_t protocol_end = url.find("://");
  if (protocol_end != std::string::npos) {
    std::string scheme = url.substr(0, protocol_end);
    if (scheme == "https") {
      result.tls = true;
    } else if (scheme == "http") {
      result.tls = false;
    } else {
      throw std::invalid_argument("Unsupported URL scheme: " + scheme);
    }
    rest = url.substr(protocol_end + 3);
  }

  // Split host[:port] from the path
  std::string host_port = rest;
  size_t slash = rest.find('/');
  if (slash != std::string::npos) {
    host_port = rest.substr(0, slash);
    result.path = rest.substr(slash);
    while (!result.path.empty() && result.path.back() == '/') {
      result.path.pop_back();
    }
  }

  size_t colon = host_port.find(':');
  if (colon != std::string::npos) {
    result.host = host_port.substr(0, colon);
    result.port = host_port.substr(colon + 1);
  } else {
    result.host = host_port;
  }
  if (result.port.empty()) {
    result.port = result.tls ? "443" : "80";
  }

  if (result.host.empty()) {
    throw std::invalid_argument("URL has no host: " + url);
  }
  return result;
}

}  // namespace common
}  // namespace engine
}  // namespace callgate

#pragma once

#include <stdexcept>
#include <string>

namespace callgate {

// Non-2xx, non-429 response from the shop API
class ShopifyApiError : public std::runtime_error {
 public:
  ShopifyApiError(int status, const std::string& reason, const std::string& body,
                  const std::string& request_id = "")
      : std::runtime_error(BuildMessage(status, reason, body)),
        status_(status),
        body_(body),
        request_id_(request_id) {}

  int GetStatus() const { return status_; }
  const std::string& GetBody() const { return body_; }
  const std::string& GetRequestId() const { return request_id_; }

 private:
  static std::string BuildMessage(int status, const std::string& reason, const std::string& body) {
    std::string message = "(" + std::to_string(status) + " " + reason + ")";
    if (!body.empty()) {
      message += " " + (body.size() > 512 ? body.substr(0, 512) + "..." : body);
    }
    return message;
  }

  int status_;
  std::string body_;
  std::string request_id_;
};

}  // namespace callgate

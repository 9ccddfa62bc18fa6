#include "shopify_service.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace callgate {

namespace http = boost::beast::http;
using engine::common::CancellationToken;

ShopifyService::ShopifyService(const std::string& base_url,
                               const std::string& access_token,
                               SmartRetryPolicy& policy,
                               std::chrono::milliseconds timeout)
    : client_(base_url, timeout), access_token_(access_token), policy_(policy) {
  if (access_token_.empty()) {
    SPDLOG_WARN("ShopifyService: no access token for {}, requests bypass admission control", base_url);
  }
}

std::unique_ptr<ShopifyService> ShopifyService::FromConfig(const engine::common::ConfigManager& config,
                                                           SmartRetryPolicy& policy) {
  std::string base_url = config.GetString("shop.base_url");
  if (base_url.empty()) {
    throw std::runtime_error("shop.base_url is not configured");
  }
  return std::make_unique<ShopifyService>(
      base_url,
      config.GetString("shop.access_token"),
      policy,
      config.GetMilliseconds("shop.timeout_ms", std::chrono::seconds(30)));
}

nlohmann::json ShopifyService::Get(const std::string& path, const CancellationToken& token) {
  return Send(http::verb::get, path, "", token);
}

nlohmann::json ShopifyService::Post(const std::string& path, const nlohmann::json& body,
                                    const CancellationToken& token) {
  return Send(http::verb::post, path, body.dump(), token);
}

nlohmann::json ShopifyService::Put(const std::string& path, const nlohmann::json& body,
                                   const CancellationToken& token) {
  return Send(http::verb::put, path, body.dump(), token);
}

nlohmann::json ShopifyService::Delete(const std::string& path, const CancellationToken& token) {
  return Send(http::verb::delete_, path, "", token);
}

nlohmann::json ShopifyService::Send(http::verb method,
                                    const std::string& path,
                                    const std::string& body,
                                    const CancellationToken& token) {
  HttpRequest request = client_.BuildRequest(method, path, access_token_, body);
  return policy_.Run<nlohmann::json>(
      request,
      [this, &token](HttpRequest& attempt) { return client_.ExecuteJson(attempt, token); },
      token);
}

}  // namespace callgate

#pragma once

#include "shopify_http_client.hpp"
#include "engine/common/config_manager.hpp"
#include "engine/throttle/smart_retry_policy.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace callgate {

/**
 * @brief JSON REST calls against one shop with one access token
 *
 * Every call goes through the shared SmartRetryPolicy, so concurrent callers
 * using the same token are paced by one bucket. The policy must outlive the
 * service.
 */
class ShopifyService {
 public:
  ShopifyService(const std::string& base_url,
                 const std::string& access_token,
                 SmartRetryPolicy& policy,
                 std::chrono::milliseconds timeout = std::chrono::seconds(30));

  // Reads shop.base_url, shop.access_token and shop.timeout_ms
  static std::unique_ptr<ShopifyService> FromConfig(const engine::common::ConfigManager& config,
                                                    SmartRetryPolicy& policy);

  nlohmann::json Get(const std::string& path,
                     const engine::common::CancellationToken& token = engine::common::CancellationToken());
  nlohmann::json Post(const std::string& path, const nlohmann::json& body,
                      const engine::common::CancellationToken& token = engine::common::CancellationToken());
  nlohmann::json Put(const std::string& path, const nlohmann::json& body,
                     const engine::common::CancellationToken& token = engine::common::CancellationToken());
  nlohmann::json Delete(const std::string& path,
                        const engine::common::CancellationToken& token = engine::common::CancellationToken());

 private:
  nlohmann::json Send(boost::beast::http::verb method,
                      const std::string& path,
                      const std::string& body,
                      const engine::common::CancellationToken& token);

  ShopifyHttpClient client_;
  std::string access_token_;
  SmartRetryPolicy& policy_;
};

}  // namespace callgate

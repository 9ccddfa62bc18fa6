#pragma once

#include "engine/common/cancellation.hpp"
#include "engine/common/util.hpp"
#include "engine/throttle/attempt_result.hpp"
#include <boost/asio/ssl/context.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace callgate {

/**
 * @brief Blocking HTTP(S) client for a shop's REST API
 *
 * Each call runs its own Beast operations on a private io_context driven by
 * the calling thread, so the client is safe to share between threads.
 * Cancelling the token stops the io_context and aborts the call with
 * OperationCancelledError. Every socket operation is bounded by the timeout.
 */
class ShopifyHttpClient {
 public:
  /**
   * @param base_url e.g. "https://my-shop.myshopify.com" or "http://127.0.0.1:8081"
   * @param timeout Per-operation I/O timeout (connect, handshake, write, read)
   */
  explicit ShopifyHttpClient(const std::string& base_url,
                             std::chrono::milliseconds timeout = std::chrono::seconds(30));
  ~ShopifyHttpClient() = default;

  ShopifyHttpClient(const ShopifyHttpClient&) = delete;
  ShopifyHttpClient& operator=(const ShopifyHttpClient&) = delete;

  /**
   * @brief Build a request template for this shop
   *
   * @param path API path relative to the base URL, e.g. "/admin/shop.json"
   * @param access_token Sent as X-Shopify-Access-Token when non-empty
   * @param body JSON body; sets Content-Type when non-empty
   */
  HttpRequest BuildRequest(boost::beast::http::verb method,
                           const std::string& path,
                           const std::string& access_token,
                           const std::string& body = "") const;

  /**
   * @brief Send one request and return the raw response, whatever its status
   *
   * @throws boost::system::system_error on network errors and timeouts,
   *         engine::common::OperationCancelledError on cancellation
   */
  HttpResponse Execute(HttpRequest& request,
                       const engine::common::CancellationToken& token = engine::common::CancellationToken());

  /**
   * @brief Send one request and classify the outcome for SmartRetryPolicy
   *
   * 2xx -> SUCCESS with the parsed JSON body ({} when empty), 429 ->
   * RATE_LIMITED, other statuses -> FAILED with ShopifyApiError, network and
   * JSON errors -> FAILED with the original exception.
   */
  AttemptResult<nlohmann::json> ExecuteJson(
      HttpRequest& request,
      const engine::common::CancellationToken& token = engine::common::CancellationToken());

 private:
  HttpResponse ExecutePlain(HttpRequest& request, const engine::common::CancellationToken& token);
  HttpResponse ExecuteTls(HttpRequest& request, const engine::common::CancellationToken& token);

  engine::common::ParsedUrl endpoint_;
  std::chrono::milliseconds timeout_;
  boost::asio::ssl::context ssl_ctx_;
};

}  // namespace callgate

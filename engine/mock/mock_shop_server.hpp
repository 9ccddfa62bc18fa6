#pragma once

#include "engine/throttle/attempt_result.hpp"
#include "engine/throttle/bucket_registry.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace callgate {

struct MockShopOptions {
  int capacity = LeakyBucket::DEFAULT_CAPACITY;
  std::chrono::milliseconds drain_interval{500};
  std::string shop_name = "callgate-mock";
  int product_count = 42;
};

/**
 * @brief Local stand-in for a shop's REST API, for tests and demos
 *
 * Plain HTTP on a background thread, one request per connection. Keeps a
 * server-side leaky bucket per access token and answers like the real API:
 * - no X-Shopify-Access-Token: 401
 * - bucket full or ForceRateLimit() pending: 429 with Retry-After
 * - GET /admin/shop.json, GET /admin/products/count.json: 200 plus
 *   X-Shopify-Shop-Api-Call-Limit
 * - anything else: 404
 */
class MockShopServer {
 public:
  explicit MockShopServer(const MockShopOptions& options = MockShopOptions());
  ~MockShopServer();

  MockShopServer(const MockShopServer&) = delete;
  MockShopServer& operator=(const MockShopServer&) = delete;

  // Bind and start serving; port 0 picks a free port
  bool Start(const std::string& address = "127.0.0.1", uint16_t port = 0);
  void Stop();

  uint16_t GetPort() const { return port_; }
  std::string GetBaseUrl() const;

  // Reject the next `count` authenticated requests with 429
  void ForceRateLimit(int count) { forced_rate_limits_.store(count); }

  int GetRequestCount() const { return request_count_.load(); }
  int GetRateLimitedCount() const { return rate_limited_count_.load(); }

 private:
  void RunServer();
  void StartAccept();
  void HandleConnection(boost::asio::ip::tcp::socket& socket);
  void HandleRequest(const HttpRequest& req, HttpResponse& resp);
  void HandleNotFound(const HttpRequest& req, HttpResponse& resp);
  void RespondJson(HttpResponse& resp, boost::beast::http::status status, const std::string& body);
  bool ConsumeForcedRateLimit();

  const MockShopOptions options_;
  BucketRegistry buckets_;

  std::atomic<bool> running_{false};
  std::string address_;
  uint16_t port_{0};
  std::thread server_thread_;
  std::unique_ptr<boost::asio::io_context> ioc_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  std::atomic<int> forced_rate_limits_{0};
  std::atomic<int> request_count_{0};
  std::atomic<int> rate_limited_count_{0};
};

}  // namespace callgate

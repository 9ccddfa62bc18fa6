/**
 * @file shop_client/main.cpp
 * @brief Burst of concurrent API calls paced by the smart retry policy
 *
 * Fires demo.requests GETs at demo.path from demo.threads threads, all with
 * the same access token, and reports how many succeeded and how long they
 * took. With the default bucket (40, one unit per 500ms) a burst of 100 sends
 * about 40 immediately and paces the rest.
 *
 * Configuration: config/shop_client.json
 * - shop.base_url empty: an in-process mock shop is started (mock.*)
 * - throttle.*: bucket capacity, drain interval and retry delay
 *
 * Usage:
 *   ./shop_client --config_file config/shop_client.json
 */

#include "engine/common/application_kernel.hpp"
#include "engine/mock/mock_shop_server.hpp"
#include "engine/shopify/shopify_api_error.hpp"
#include "engine/shopify/shopify_service.hpp"
#include "engine/throttle/smart_retry_policy.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace callgate::engine::common;
using callgate::MockShopOptions;
using callgate::MockShopServer;
using callgate::ShopifyApiError;
using callgate::ShopifyService;
using callgate::SmartRetryOptions;
using callgate::SmartRetryPolicy;

class ShopClientApp : public ApplicationKernel {
 public:
  ShopClientApp() {
    SetAppName("shop_client");
  }

 protected:
  void OnInitialize() override {
    auto& config = GetConfig();
    policy_ = std::make_unique<SmartRetryPolicy>(SmartRetryOptions::FromConfig(config));
    const SmartRetryOptions& options = policy_->GetOptions();
    SPDLOG_INFO("Throttle: capacity {}, drain {}ms per call, retry delay {}ms",
                options.default_capacity, options.drain_interval.count(), options.retry_delay.count());

    if (config.GetString("shop.base_url").empty()) {
      MockShopOptions mock_options;
      mock_options.capacity = config.GetInt("mock.capacity", mock_options.capacity);
      mock_options.drain_interval = config.GetMilliseconds("mock.drain_interval_ms", mock_options.drain_interval);
      mock_ = std::make_unique<MockShopServer>(mock_options);
      if (!mock_->Start("127.0.0.1", static_cast<uint16_t>(config.GetInt("mock.port", 0)))) {
        throw std::runtime_error("Cannot start mock shop server");
      }
      config.SetString("shop.base_url", mock_->GetBaseUrl());
    }

    service_ = ShopifyService::FromConfig(config, *policy_);
  }

  void OnStart() override {
    int requests = std::max(1, GetConfig().GetInt("demo.requests", 100));
    int threads = std::clamp(GetConfig().GetInt("demo.threads", 16), 1, requests);
    std::string path = GetConfig().GetString("demo.path", "/admin/shop.json");

    runner_ = std::thread([this, requests, threads, path]() {
      RunBurst(requests, threads, path);
      RequestStop();
    });
  }

  void OnStop() override {
    if (runner_.joinable()) {
      runner_.join();
    }
    if (mock_) {
      mock_->Stop();
    }
  }

 private:
  void RunBurst(int requests, int threads, const std::string& path) {
    std::atomic<int> next{0};
    std::atomic<int> succeeded{0};
    std::atomic<int> failed{0};
    std::atomic<int> cancelled{0};
    std::atomic<long long> total_latency_ms{0};
    std::atomic<long long> max_latency_ms{0};
    CancellationToken token = GetCancellationToken();

    SPDLOG_INFO("Sending {} requests to {} from {} threads", requests, path, threads);
    auto burst_start = std::chrono::steady_clock::now();

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
      workers.emplace_back([&]() {
        for (int i = next++; i < requests; i = next++) {
          auto start = std::chrono::steady_clock::now();
          try {
            service_->Get(path, token);
            succeeded++;
          } catch (const OperationCancelledError&) {
            cancelled++;
            return;
          } catch (const ShopifyApiError& e) {
            SPDLOG_ERROR("Request {} failed with status {} (request id '{}'): {}",
                         i, e.GetStatus(), e.GetRequestId(), e.what());
            failed++;
          } catch (const std::exception& e) {
            SPDLOG_ERROR("Request {} failed: {}", i, e.what());
            failed++;
          }
          long long latency = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - start).count();
          total_latency_ms += latency;
          long long seen = max_latency_ms.load();
          while (latency > seen && !max_latency_ms.compare_exchange_weak(seen, latency)) {
          }
        }
      });
    }
    for (auto& worker : workers) {
      worker.join();
    }

    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - burst_start).count();
    int completed = succeeded.load() + failed.load();
    SPDLOG_INFO("Burst done in {}ms: {} succeeded, {} failed, {} cancelled, avg latency {}ms, max {}ms",
                elapsed_ms, succeeded.load(), failed.load(), cancelled.load(),
                completed > 0 ? total_latency_ms.load() / completed : 0, max_latency_ms.load());
    if (mock_) {
      SPDLOG_INFO("Mock shop saw {} requests, {} rejected with 429",
                  mock_->GetRequestCount(), mock_->GetRateLimitedCount());
    }
    if (failed.load() > 0) {
      SetExitCode(2);
    }
  }

  std::unique_ptr<SmartRetryPolicy> policy_;
  std::unique_ptr<MockShopServer> mock_;
  std::unique_ptr<ShopifyService> service_;
  std::thread runner_;
};

int main(int argc, char** argv) {
  ShopClientApp app;
  return app.Run(argc, argv);
}

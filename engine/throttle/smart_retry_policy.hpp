#pragma once

#include "attempt_result.hpp"
#include "bucket_registry.hpp"
#include "bucket_state.hpp"
#include "engine/common/cancellation.hpp"
#include "engine/common/config_manager.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace callgate {

struct SmartRetryOptions {
  std::chrono::milliseconds drain_interval{500};  // One unit leaks per interval
  std::chrono::milliseconds retry_delay{500};     // Pause after a 429
  int default_capacity = LeakyBucket::DEFAULT_CAPACITY;

  // Reads throttle.drain_interval_ms, throttle.retry_delay_ms, throttle.default_capacity
  static SmartRetryOptions FromConfig(const engine::common::ConfigManager& config);
};

/**
 * @brief Execution policy that paces requests through per-token leaky buckets
 *
 * For example, if 100 requests are started in parallel against a bucket of
 * 40, about 40 are sent immediately and the rest trickle out at one per drain
 * interval instead of failing and retrying en masse.
 *
 * Requests without an access token header bypass the buckets entirely. When
 * the remote service rejects a request anyway (other processes sharing the
 * token, clock skew, a different remote algorithm) the attempt is retried
 * after retry_delay, with no retry ceiling; the caller's CancellationToken is
 * the only bound. Every other failure propagates on the first attempt.
 *
 * The policy owns its BucketRegistry; share one policy instance between all
 * callers that use the same tokens.
 */
class SmartRetryPolicy {
 public:
  template <typename T>
  using ExecuteRequest = std::function<AttemptResult<T>(HttpRequest& request)>;

  SmartRetryPolicy() : SmartRetryPolicy(SmartRetryOptions()) {}
  explicit SmartRetryPolicy(const SmartRetryOptions& options);

  SmartRetryPolicy(const SmartRetryPolicy&) = delete;
  SmartRetryPolicy& operator=(const SmartRetryPolicy&) = delete;

  /**
   * @brief Execute a request under admission control
   *
   * Each attempt gets a fresh copy of base_request. The execute function
   * should honor the same cancellation token for the transport call itself.
   *
   * @return Value of the first successful attempt
   * @throws The original error of a FAILED attempt, or
   *         engine::common::OperationCancelledError when cancelled
   */
  template <typename T>
  T Run(const HttpRequest& base_request,
        const ExecuteRequest<T>& execute,
        const engine::common::CancellationToken& token = engine::common::CancellationToken());

  BucketRegistry& GetRegistry() { return registry_; }
  const BucketRegistry& GetRegistry() const { return registry_; }
  const SmartRetryOptions& GetOptions() const { return options_; }

  // Value of the access token header, nullopt if absent or empty
  static std::optional<std::string> GetAccessToken(const HttpRequest& request);

  // Parsed call-limit header, nullopt if absent or malformed
  static std::optional<BucketState> GetBucketState(const HttpResponse& response);

 private:
  LeakyBucket* ResolveBucket(const HttpRequest& request);
  void Reconcile(LeakyBucket* bucket, const HttpResponse& response);
  void WaitAfterRateLimit(int attempt, const engine::common::CancellationToken& token);

  const SmartRetryOptions options_;
  BucketRegistry registry_;
};

template <typename T>
T SmartRetryPolicy::Run(const HttpRequest& base_request,
                        const ExecuteRequest<T>& execute,
                        const engine::common::CancellationToken& token) {
  LeakyBucket* bucket = ResolveBucket(base_request);

  for (int attempt = 1;; ++attempt) {
    token.ThrowIfCancelled();

    // The transport may consume the request; every attempt gets its own copy
    HttpRequest request = base_request;

    if (bucket) {
      bucket->Grant(token);
    }

    AttemptResult<T> result = execute(request);

    switch (result.GetStatus()) {
      case AttemptStatus::SUCCESS:
        Reconcile(bucket, result.GetResponse());
        return result.TakeValue();
      case AttemptStatus::RATE_LIMITED:
        WaitAfterRateLimit(attempt, token);
        break;
      case AttemptStatus::FAILED:
        std::rethrow_exception(result.GetError());
    }
  }
}

}  // namespace callgate

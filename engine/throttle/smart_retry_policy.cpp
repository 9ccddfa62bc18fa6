#include "smart_retry_policy.hpp"
#include <spdlog/spdlog.h>

namespace callgate {

using engine::common::CancellationToken;
using engine::common::ConfigManager;
using engine::common::OperationCancelledError;

SmartRetryOptions SmartRetryOptions::FromConfig(const ConfigManager& config) {
  SmartRetryOptions options;
  options.drain_interval = config.GetMilliseconds("throttle.drain_interval_ms", options.drain_interval);
  options.retry_delay = config.GetMilliseconds("throttle.retry_delay_ms", options.retry_delay);
  options.default_capacity = config.GetInt("throttle.default_capacity", options.default_capacity);

  if (options.drain_interval.count() <= 0) {
    SPDLOG_WARN("throttle.drain_interval_ms must be positive, using 500");
    options.drain_interval = std::chrono::milliseconds(500);
  }
  if (options.default_capacity <= 0) {
    SPDLOG_WARN("throttle.default_capacity must be positive, using {}", LeakyBucket::DEFAULT_CAPACITY);
    options.default_capacity = LeakyBucket::DEFAULT_CAPACITY;
  }
  return options;
}

SmartRetryPolicy::SmartRetryPolicy(const SmartRetryOptions& options)
    : options_(options), registry_(options.default_capacity, options.drain_interval) {
  SPDLOG_DEBUG("SmartRetryPolicy: capacity={}, drain_interval={}ms, retry_delay={}ms",
               options_.default_capacity, options_.drain_interval.count(), options_.retry_delay.count());
}

std::optional<std::string> SmartRetryPolicy::GetAccessToken(const HttpRequest& request) {
  auto it = request.find(ACCESS_TOKEN_HEADER);
  if (it == request.end() || it->value().empty()) {
    return std::nullopt;
  }
  return std::string(it->value().data(), it->value().size());
}

std::optional<BucketState> SmartRetryPolicy::GetBucketState(const HttpResponse& response) {
  auto it = response.find(CALL_LIMIT_HEADER);
  if (it == response.end()) {
    return std::nullopt;
  }
  std::string_view value(it->value().data(), it->value().size());
  auto state = ParseCallLimit(value);
  if (!state) {
    SPDLOG_DEBUG("SmartRetryPolicy: ignoring malformed {} header '{}'", CALL_LIMIT_HEADER, value);
  }
  return state;
}

LeakyBucket* SmartRetryPolicy::ResolveBucket(const HttpRequest& request) {
  auto access_token = GetAccessToken(request);
  if (!access_token) {
    return nullptr;
  }
  return &registry_.GetOrCreate(*access_token);
}

void SmartRetryPolicy::Reconcile(LeakyBucket* bucket, const HttpResponse& response) {
  if (!bucket) {
    return;
  }
  if (auto state = GetBucketState(response)) {
    bucket->SetState(*state);
  }
}

void SmartRetryPolicy::WaitAfterRateLimit(int attempt, const CancellationToken& token) {
  SPDLOG_WARN("SmartRetryPolicy: rate limited on attempt {}, retrying in {}ms",
              attempt, options_.retry_delay.count());
  if (!token.SleepFor(options_.retry_delay)) {
    throw OperationCancelledError("Cancelled while waiting to retry a rate-limited request");
  }
}

}  // namespace callgate

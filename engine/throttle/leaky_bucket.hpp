#pragma once

#include "bucket_state.hpp"
#include "engine/common/cancellation.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace callgate {

/**
 * @brief Leaky bucket admission gate for one access token
 *
 * Tracks an estimate of the remote call-limit bucket: every admitted request
 * adds one unit, the level drains continuously by one unit per drain interval,
 * and authoritative observations from response headers replace the estimate.
 *
 * Thread-safe. Leak, admission decision and mutation happen under one lock,
 * so no two callers observe the same leakage window. Waiters sleep without
 * holding the lock and are woken early by SetState() and by cancellation.
 * Wake order among waiters is unspecified.
 */
class LeakyBucket {
 public:
  static constexpr int DEFAULT_CAPACITY = 40;
  static constexpr std::chrono::milliseconds DEFAULT_DRAIN_INTERVAL{500};

  explicit LeakyBucket(int capacity = DEFAULT_CAPACITY,
                       std::chrono::steady_clock::duration drain_interval = DEFAULT_DRAIN_INTERVAL);
  ~LeakyBucket() = default;

  // Non-copyable, non-movable (waiters hold references)
  LeakyBucket(const LeakyBucket&) = delete;
  LeakyBucket& operator=(const LeakyBucket&) = delete;
  LeakyBucket(LeakyBucket&&) = delete;
  LeakyBucket& operator=(LeakyBucket&&) = delete;

  /**
   * @brief Block until one more unit fits under capacity, then take it
   *
   * @throws engine::common::OperationCancelledError if the token is cancelled
   *         before admission. A cancelled caller never consumes a unit.
   */
  void Grant(const engine::common::CancellationToken& token = engine::common::CancellationToken());

  // Take one unit if it fits right now (non-blocking)
  bool TryGrant();

  // Replace capacity and fill level with an observed state and wake waiters
  void SetState(const BucketState& state);

  int GetCapacity() const;

  // Current estimate with leakage applied up to now (state is not mutated)
  double GetEstimatedFillLevel() const;

  std::chrono::steady_clock::duration GetDrainInterval() const { return drain_interval_; }

  // Number of callers currently suspended in Grant()
  size_t GetWaiterCount() const;

 private:
  // All private helpers require mutex_ to be held
  void Leak(std::chrono::steady_clock::time_point now);
  bool TryAdmit(std::chrono::steady_clock::time_point now);
  std::chrono::steady_clock::duration TimeUntilAdmissible() const;

  int capacity_;
  double fill_level_{0.0};
  const std::chrono::steady_clock::duration drain_interval_;
  std::chrono::steady_clock::time_point last_update_;
  size_t waiters_{0};

  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

}  // namespace callgate

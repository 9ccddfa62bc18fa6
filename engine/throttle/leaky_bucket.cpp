#include "leaky_bucket.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace callgate {

using engine::common::CancellationToken;
using engine::common::OperationCancelledError;

namespace {

double DrainedUnits(std::chrono::steady_clock::duration elapsed,
                    std::chrono::steady_clock::duration drain_interval) {
  using Seconds = std::chrono::duration<double>;
  return Seconds(elapsed).count() / Seconds(drain_interval).count();
}

}  // namespace

LeakyBucket::LeakyBucket(int capacity, std::chrono::steady_clock::duration drain_interval)
    : capacity_(capacity),
      drain_interval_(drain_interval),
      last_update_(std::chrono::steady_clock::now()) {
  if (capacity <= 0) {
    throw std::invalid_argument("LeakyBucket: capacity must be positive");
  }
  if (drain_interval <= std::chrono::steady_clock::duration::zero()) {
    throw std::invalid_argument("LeakyBucket: drain interval must be positive");
  }
}

void LeakyBucket::Grant(const CancellationToken& token) {
  token.ThrowIfCancelled();

  // Registered before taking mutex_: an already-cancelled token runs the
  // callback inline, and the callback itself locks mutex_.
  auto registration = token.Register([this] {
    std::lock_guard<std::mutex> guard(mutex_);
    cv_.notify_all();
  });

  std::unique_lock<std::mutex> lock(mutex_);
  if (TryAdmit(std::chrono::steady_clock::now())) {
    return;
  }

  struct WaiterScope {
    size_t& count;
    explicit WaiterScope(size_t& c) : count(c) { ++count; }
    ~WaiterScope() { --count; }
  } waiter_scope(waiters_);

  while (true) {
    if (token.IsCancelled()) {
      throw OperationCancelledError("Cancelled while waiting for bucket admission");
    }
    if (TryAdmit(std::chrono::steady_clock::now())) {
      return;
    }
    auto wait = TimeUntilAdmissible();
    SPDLOG_DEBUG("LeakyBucket: level {:.2f}/{} full, waiting {}ms ({} waiters)",
                 fill_level_, capacity_,
                 std::chrono::duration_cast<std::chrono::milliseconds>(wait).count(), waiters_);
    cv_.wait_for(lock, wait);
  }
}

bool LeakyBucket::TryGrant() {
  std::lock_guard<std::mutex> lock(mutex_);
  return TryAdmit(std::chrono::steady_clock::now());
}

void LeakyBucket::SetState(const BucketState& state) {
  if (state.capacity <= 0) {
    SPDLOG_WARN("LeakyBucket: ignoring state with non-positive capacity {}", state.capacity);
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    SPDLOG_TRACE("LeakyBucket: estimate {:.2f}/{} corrected to {}",
                 fill_level_, capacity_, FormatCallLimit(state));
    capacity_ = state.capacity;
    fill_level_ = std::max(0, state.current_fill_level);
    last_update_ = std::chrono::steady_clock::now();
  }
  cv_.notify_all();
}

int LeakyBucket::GetCapacity() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return capacity_;
}

double LeakyBucket::GetEstimatedFillLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto elapsed = std::chrono::steady_clock::now() - last_update_;
  return std::max(0.0, fill_level_ - DrainedUnits(elapsed, drain_interval_));
}

size_t LeakyBucket::GetWaiterCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return waiters_;
}

void LeakyBucket::Leak(std::chrono::steady_clock::time_point now) {
  if (now <= last_update_) {
    return;
  }
  fill_level_ = std::max(0.0, fill_level_ - DrainedUnits(now - last_update_, drain_interval_));
  last_update_ = now;
}

bool LeakyBucket::TryAdmit(std::chrono::steady_clock::time_point now) {
  Leak(now);
  if (fill_level_ + 1.0 <= static_cast<double>(capacity_)) {
    fill_level_ += 1.0;
    return true;
  }
  return false;
}

std::chrono::steady_clock::duration LeakyBucket::TimeUntilAdmissible() const {
  double deficit = fill_level_ + 1.0 - static_cast<double>(capacity_);
  if (deficit <= 0.0) {
    return std::chrono::steady_clock::duration::zero();
  }
  auto wait = std::chrono::ceil<std::chrono::steady_clock::duration>(drain_interval_ * deficit);
  return std::max(wait, std::chrono::steady_clock::duration(1));
}

}  // namespace callgate

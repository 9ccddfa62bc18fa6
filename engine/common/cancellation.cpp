#include "cancellation.hpp"
#include <spdlog/spdlog.h>
#include <thread>

namespace callgate {
namespace engine {
namespace common {

//==============================================================================
// CancellationState
//==============================================================================

void CancellationState::Cancel() {
  // Held while callbacks run so RemoveCallback() can wait for them
  std::lock_guard<std::mutex> running(callback_mutex_);
  std::map<int, std::function<void()>> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
      return;  // Already cancelled
    }
    callbacks.swap(callbacks_);
  }
  cv_.notify_all();

  for (auto& [id, callback] : callbacks) {
    try {
      callback();
    } catch (const std::exception& e) {
      SPDLOG_ERROR("Cancellation callback {} threw: {}", id, e.what());
    }
  }
}

int CancellationState::AddCallback(std::function<void()> callback) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_.load(std::memory_order_acquire)) {
      int id = next_callback_id_++;
      callbacks_.emplace(id, std::move(callback));
      return id;
    }
  }
  callback();
  return 0;
}

void CancellationState::RemoveCallback(int id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (callbacks_.erase(id) > 0) {
      return;
    }
  }
  // Already taken by Cancel(); the callback may still be running
  std::lock_guard<std::mutex> running(callback_mutex_);
}

bool CancellationState::SleepFor(std::chrono::steady_clock::duration duration) {
  std::unique_lock<std::mutex> lock(mutex_);
  return !cv_.wait_for(lock, duration, [this] {
    return cancelled_.load(std::memory_order_acquire);
  });
}

//==============================================================================
// CancellationRegistration
//==============================================================================

void CancellationRegistration::Reset() {
  if (state_ && id_ != 0) {
    state_->RemoveCallback(id_);
  }
  state_.reset();
  id_ = 0;
}

//==============================================================================
// CancellationToken
//==============================================================================

void CancellationToken::ThrowIfCancelled() const {
  if (IsCancelled()) {
    throw OperationCancelledError();
  }
}

CancellationRegistration CancellationToken::Register(std::function<void()> callback) const {
  if (!state_) {
    return CancellationRegistration();
  }
  int id = state_->AddCallback(std::move(callback));
  return CancellationRegistration(state_, id);
}

bool CancellationToken::SleepFor(std::chrono::steady_clock::duration duration) const {
  if (!state_) {
    std::this_thread::sleep_for(duration);
    return true;
  }
  return state_->SleepFor(duration);
}

}  // namespace common
}  // namespace engine
}  // namespace callgate

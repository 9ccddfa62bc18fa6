#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace callgate {
namespace engine {
namespace common {

// Thrown when a blocking operation is aborted by its CancellationToken
class OperationCancelledError : public std::runtime_error {
 public:
  OperationCancelledError() : std::runtime_error("Operation cancelled") {}
  explicit OperationCancelledError(const std::string& what) : std::runtime_error(what) {}
};

class CancellationToken;

/**
 * @brief Shared cancellation flag with callback registration
 *
 * Owned jointly by a CancellationSource and every token handed out from it.
 * Callbacks run exactly once, on the thread that calls Cancel(), or
 * immediately on registration if cancellation already happened.
 * RemoveCallback() does not return while the removed callback is running, so
 * a callback may reference anything that lives as long as its registration.
 */
class CancellationState {
 public:
  CancellationState() = default;

  CancellationState(const CancellationState&) = delete;
  CancellationState& operator=(const CancellationState&) = delete;

  void Cancel();
  bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }

  // Returns 0 if the callback was run inline (already cancelled)
  int AddCallback(std::function<void()> callback);
  void RemoveCallback(int id);

  // Returns false if cancelled before the duration elapsed
  bool SleepFor(std::chrono::steady_clock::duration duration);

 private:
  std::atomic<bool> cancelled_{false};
  std::mutex callback_mutex_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::map<int, std::function<void()>> callbacks_;
  int next_callback_id_{1};
};

/**
 * @brief RAII handle that unregisters a cancellation callback
 */
class CancellationRegistration {
 public:
  CancellationRegistration() = default;
  CancellationRegistration(std::shared_ptr<CancellationState> state, int id)
      : state_(std::move(state)), id_(id) {}
  ~CancellationRegistration() { Reset(); }

  CancellationRegistration(const CancellationRegistration&) = delete;
  CancellationRegistration& operator=(const CancellationRegistration&) = delete;
  CancellationRegistration(CancellationRegistration&& other) noexcept
      : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
  }
  CancellationRegistration& operator=(CancellationRegistration&& other) noexcept {
    if (this != &other) {
      Reset();
      state_ = std::move(other.state_);
      id_ = other.id_;
      other.id_ = 0;
    }
    return *this;
  }

  void Reset();

 private:
  std::shared_ptr<CancellationState> state_;
  int id_{0};
};

/**
 * @brief Observer side of a cancellation source
 *
 * Cheap to copy. A default-constructed token is never cancelled.
 */
class CancellationToken {
 public:
  CancellationToken() = default;
  explicit CancellationToken(std::shared_ptr<CancellationState> state) : state_(std::move(state)) {}

  bool IsCancelled() const { return state_ && state_->IsCancelled(); }
  bool CanBeCancelled() const { return static_cast<bool>(state_); }

  /** @brief Throw OperationCancelledError if cancellation was requested */
  void ThrowIfCancelled() const;

  /** @brief Run callback on cancellation; unregistered when the handle dies */
  CancellationRegistration Register(std::function<void()> callback) const;

  /** @brief Sleep for duration, waking early on cancellation (returns false then) */
  bool SleepFor(std::chrono::steady_clock::duration duration) const;

 private:
  std::shared_ptr<CancellationState> state_;
};

/**
 * @brief Owner side: hands out tokens and triggers cancellation
 */
class CancellationSource {
 public:
  CancellationSource() : state_(std::make_shared<CancellationState>()) {}

  CancellationToken GetToken() const { return CancellationToken(state_); }
  void Cancel() { state_->Cancel(); }
  bool IsCancelled() const { return state_->IsCancelled(); }

 private:
  std::shared_ptr<CancellationState> state_;
};

}  // namespace common
}  // namespace engine
}  // namespace callgate

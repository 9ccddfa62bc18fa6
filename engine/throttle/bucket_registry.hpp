#pragma once

#include "leaky_bucket.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace callgate {

// Owns one LeakyBucket per access token. Buckets are created on first use
// and live as long as the registry; returned references stay valid.
class BucketRegistry {
 public:
  explicit BucketRegistry(int default_capacity = LeakyBucket::DEFAULT_CAPACITY,
                          std::chrono::steady_clock::duration drain_interval =
                              LeakyBucket::DEFAULT_DRAIN_INTERVAL);
  ~BucketRegistry() = default;

  BucketRegistry(const BucketRegistry&) = delete;
  BucketRegistry& operator=(const BucketRegistry&) = delete;

  // Atomic get-or-insert: concurrent first callers share one bucket
  LeakyBucket& GetOrCreate(const std::string& access_token);

  // Returns nullptr if no bucket exists for the token
  LeakyBucket* Find(const std::string& access_token) const;

  size_t Size() const;

 private:
  const int default_capacity_;
  const std::chrono::steady_clock::duration drain_interval_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::unique_ptr<LeakyBucket>> buckets_;
};

}  // namespace callgate

#include "bucket_registry.hpp"
#include <spdlog/spdlog.h>

namespace callgate {

BucketRegistry::BucketRegistry(int default_capacity,
                               std::chrono::steady_clock::duration drain_interval)
    : default_capacity_(default_capacity), drain_interval_(drain_interval) {}

LeakyBucket& BucketRegistry::GetOrCreate(const std::string& access_token) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = buckets_.find(access_token);
  if (it != buckets_.end()) {
    return *it->second;
  }

  auto bucket = std::make_unique<LeakyBucket>(default_capacity_, drain_interval_);
  LeakyBucket& ref = *bucket;
  buckets_.emplace(access_token, std::move(bucket));
  SPDLOG_DEBUG("BucketRegistry: created bucket #{} (capacity {})", buckets_.size(), default_capacity_);
  return ref;
}

LeakyBucket* BucketRegistry::Find(const std::string& access_token) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = buckets_.find(access_token);
  return it == buckets_.end() ? nullptr : it->second.get();
}

size_t BucketRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buckets_.size();
}

}  // namespace callgate

#include <gtest/gtest.h>
#include <set>
#include <thread>
#include <vector>
#include "bucket_registry.hpp"

using namespace callgate;
using namespace std::chrono_literals;

class BucketRegistryTest : public ::testing::Test {
 protected:
  BucketRegistry registry_{40, std::chrono::hours(1)};
};

TEST_F(BucketRegistryTest, GetOrCreate_SameTokenSameBucket) {
  LeakyBucket& a = registry_.GetOrCreate("token-a");
  LeakyBucket& b = registry_.GetOrCreate("token-a");
  EXPECT_EQ(&a, &b);
  EXPECT_EQ(registry_.Size(), 1u);
}

TEST_F(BucketRegistryTest, GetOrCreate_UsesDefaults) {
  LeakyBucket& bucket = registry_.GetOrCreate("token-a");
  EXPECT_EQ(bucket.GetCapacity(), 40);
  EXPECT_EQ(bucket.GetDrainInterval(), std::chrono::steady_clock::duration(std::chrono::hours(1)));
}

TEST_F(BucketRegistryTest, Find) {
  EXPECT_EQ(registry_.Find("missing"), nullptr);
  LeakyBucket& bucket = registry_.GetOrCreate("token-a");
  EXPECT_EQ(registry_.Find("token-a"), &bucket);
}

TEST_F(BucketRegistryTest, TokensAreIsolated) {
  LeakyBucket& a = registry_.GetOrCreate("token-a");
  LeakyBucket& b = registry_.GetOrCreate("token-b");
  EXPECT_NE(&a, &b);

  for (int i = 0; i < 40; ++i) {
    ASSERT_TRUE(a.TryGrant());
  }
  EXPECT_FALSE(a.TryGrant());
  EXPECT_TRUE(b.TryGrant());
  EXPECT_NEAR(b.GetEstimatedFillLevel(), 1.0, 1e-3);
}

TEST_F(BucketRegistryTest, SetStateIsolated) {
  LeakyBucket& a = registry_.GetOrCreate("token-a");
  LeakyBucket& b = registry_.GetOrCreate("token-b");
  ASSERT_TRUE(b.TryGrant());

  a.SetState(BucketState{80, 70});
  EXPECT_EQ(a.GetCapacity(), 80);
  EXPECT_NEAR(a.GetEstimatedFillLevel(), 70.0, 1e-3);

  EXPECT_EQ(b.GetCapacity(), 40);
  EXPECT_NEAR(b.GetEstimatedFillLevel(), 1.0, 1e-3);
  for (int i = 0; i < 39; ++i) {
    EXPECT_TRUE(b.TryGrant()) << "Failed to grant unit " << i;
  }
  EXPECT_FALSE(b.TryGrant());
}

TEST_F(BucketRegistryTest, ConcurrentFirstUse_SingleBucket) {
  std::vector<LeakyBucket*> seen(16, nullptr);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < seen.size(); ++i) {
    threads.emplace_back([this, &seen, i]() { seen[i] = &registry_.GetOrCreate("shared"); });
  }
  for (auto& t : threads) {
    t.join();
  }

  std::set<LeakyBucket*> unique(seen.begin(), seen.end());
  EXPECT_EQ(unique.size(), 1u);
  EXPECT_EQ(registry_.Size(), 1u);
}

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "leaky_bucket.hpp"

using namespace callgate;
using namespace callgate::engine::common;
using namespace std::chrono_literals;

class LeakyBucketTest : public ::testing::Test {
 protected:
  // Drain so slow that nothing leaks during a test
  static constexpr std::chrono::hours FROZEN{1};

  static void WaitForWaiters(const LeakyBucket& bucket, size_t count) {
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (bucket.GetWaiterCount() < count && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(5ms);
    }
  }
};

TEST_F(LeakyBucketTest, Constructor_RejectsInvalidArguments) {
  EXPECT_THROW(LeakyBucket(0, 500ms), std::invalid_argument);
  EXPECT_THROW(LeakyBucket(-3, 500ms), std::invalid_argument);
  EXPECT_THROW(LeakyBucket(40, 0ms), std::invalid_argument);
}

TEST_F(LeakyBucketTest, Defaults) {
  LeakyBucket bucket;
  EXPECT_EQ(bucket.GetCapacity(), 40);
  EXPECT_EQ(bucket.GetDrainInterval(), std::chrono::steady_clock::duration(500ms));
  EXPECT_DOUBLE_EQ(bucket.GetEstimatedFillLevel(), 0.0);
}

TEST_F(LeakyBucketTest, TryGrant_UpToCapacity) {
  LeakyBucket bucket(40, FROZEN);
  for (int i = 0; i < 40; ++i) {
    EXPECT_TRUE(bucket.TryGrant()) << "Failed to grant unit " << i;
  }
  EXPECT_FALSE(bucket.TryGrant());
  EXPECT_LE(bucket.GetEstimatedFillLevel(), 40.0);
}

TEST_F(LeakyBucketTest, Grant_FillNeverExceedsCapacity) {
  LeakyBucket bucket(10, FROZEN);
  for (int i = 0; i < 10; ++i) {
    bucket.Grant();
    EXPECT_LE(bucket.GetEstimatedFillLevel(), 10.0);
  }
  EXPECT_FALSE(bucket.TryGrant());
}

TEST_F(LeakyBucketTest, Leak_DecreasesMonotonically) {
  LeakyBucket bucket(10, 20ms);
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(bucket.TryGrant());
  }

  double previous = bucket.GetEstimatedFillLevel();
  for (int i = 0; i < 5; ++i) {
    std::this_thread::sleep_for(15ms);
    double current = bucket.GetEstimatedFillLevel();
    EXPECT_LE(current, previous);
    EXPECT_GE(current, 0.0);
    previous = current;
  }
  EXPECT_LT(previous, 10.0);

  // Long enough to drain completely, clamped at zero
  std::this_thread::sleep_for(300ms);
  EXPECT_DOUBLE_EQ(bucket.GetEstimatedFillLevel(), 0.0);
}

TEST_F(LeakyBucketTest, SetState_ReplacesEstimate) {
  LeakyBucket bucket(40, FROZEN);
  bucket.SetState(BucketState{40, 5});

  // 35 units of headroom remain; at least 34 are admitted immediately
  int admitted = 0;
  while (bucket.TryGrant()) {
    ++admitted;
    ASSERT_LE(admitted, 40);
  }
  EXPECT_GE(admitted, 34);
  EXPECT_LE(admitted, 35);
}

TEST_F(LeakyBucketTest, SetState_NextGrantSuspends) {
  LeakyBucket bucket(40, FROZEN);
  bucket.SetState(BucketState{40, 5});
  for (int i = 0; i < 34; ++i) {
    bucket.Grant();
  }
  while (bucket.TryGrant()) {
  }

  CancellationSource source;
  std::atomic<bool> granted{false};
  std::thread waiter([&]() {
    try {
      bucket.Grant(source.GetToken());
      granted = true;
    } catch (const OperationCancelledError&) {
    }
  });

  WaitForWaiters(bucket, 1);
  EXPECT_EQ(bucket.GetWaiterCount(), 1u);
  EXPECT_FALSE(granted.load());

  source.Cancel();
  waiter.join();
  EXPECT_FALSE(granted.load());
}

TEST_F(LeakyBucketTest, SetState_AdoptsNewCapacity) {
  LeakyBucket bucket(40, FROZEN);
  bucket.SetState(BucketState{80, 0});
  EXPECT_EQ(bucket.GetCapacity(), 80);
  for (int i = 0; i < 80; ++i) {
    EXPECT_TRUE(bucket.TryGrant());
  }
  EXPECT_FALSE(bucket.TryGrant());
}

TEST_F(LeakyBucketTest, SetState_IgnoresNonPositiveCapacity) {
  LeakyBucket bucket(40, FROZEN);
  bucket.SetState(BucketState{0, 0});
  EXPECT_EQ(bucket.GetCapacity(), 40);
}

TEST_F(LeakyBucketTest, SetState_WakesWaiters) {
  LeakyBucket bucket(5, FROZEN);
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(bucket.TryGrant());
  }

  std::atomic<int> granted{0};
  std::vector<std::thread> waiters;
  for (int i = 0; i < 3; ++i) {
    waiters.emplace_back([&]() {
      bucket.Grant();
      granted++;
    });
  }
  WaitForWaiters(bucket, 3);
  EXPECT_EQ(granted.load(), 0);

  // Remote bucket is actually empty
  bucket.SetState(BucketState{5, 0});
  for (auto& t : waiters) {
    t.join();
  }
  EXPECT_EQ(granted.load(), 3);
  EXPECT_EQ(bucket.GetWaiterCount(), 0u);
}

TEST_F(LeakyBucketTest, Grant_BlocksUntilLeak) {
  LeakyBucket bucket(2, 100ms);
  ASSERT_TRUE(bucket.TryGrant());
  ASSERT_TRUE(bucket.TryGrant());

  auto start = std::chrono::steady_clock::now();
  bucket.Grant();
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_GE(elapsed, 80ms);
  EXPECT_LT(elapsed, 1s);
}

TEST_F(LeakyBucketTest, Grant_CancelledWhileWaiting) {
  LeakyBucket bucket(1, FROZEN);
  ASSERT_TRUE(bucket.TryGrant());
  double level_before = bucket.GetEstimatedFillLevel();

  CancellationSource source;
  std::atomic<bool> cancelled{false};
  std::thread waiter([&]() {
    try {
      bucket.Grant(source.GetToken());
    } catch (const OperationCancelledError&) {
      cancelled = true;
    }
  });

  WaitForWaiters(bucket, 1);
  auto start = std::chrono::steady_clock::now();
  source.Cancel();
  waiter.join();

  EXPECT_TRUE(cancelled.load());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
  EXPECT_EQ(bucket.GetWaiterCount(), 0u);
  // A cancelled waiter consumes nothing
  EXPECT_NEAR(bucket.GetEstimatedFillLevel(), level_before, 1e-3);
}

TEST_F(LeakyBucketTest, Grant_AlreadyCancelledToken) {
  LeakyBucket bucket(10, FROZEN);
  CancellationSource source;
  source.Cancel();
  EXPECT_THROW(bucket.Grant(source.GetToken()), OperationCancelledError);
  EXPECT_DOUBLE_EQ(bucket.GetEstimatedFillLevel(), 0.0);
}

TEST_F(LeakyBucketTest, ConcurrentGrants_NeverOverAdmit) {
  LeakyBucket bucket(20, FROZEN);
  std::atomic<int> admitted{0};
  std::vector<std::thread> threads;

  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 10; ++i) {
        if (bucket.TryGrant()) {
          admitted++;
        }
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(admitted.load(), 20);
  EXPECT_LE(bucket.GetEstimatedFillLevel(), 20.0);
}

TEST_F(LeakyBucketTest, ConcurrentGrants_PacedByDrain) {
  // 10 immediate, the remaining 5 need about 5 * 20ms of leakage
  LeakyBucket bucket(10, 20ms);
  std::vector<std::thread> threads;
  auto start = std::chrono::steady_clock::now();

  for (int t = 0; t < 15; ++t) {
    threads.emplace_back([&]() { bucket.Grant(); });
  }
  for (auto& t : threads) {
    t.join();
  }

  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_GE(elapsed, 80ms);
  EXPECT_LT(elapsed, 2s);
  EXPECT_LE(bucket.GetEstimatedFillLevel(), 10.0);
}

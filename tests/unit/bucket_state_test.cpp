#include <gtest/gtest.h>
#include "bucket_state.hpp"

using namespace callgate;

TEST(BucketStateTest, ParseCallLimit_Valid) {
  auto state = ParseCallLimit("32/40");
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(state->current_fill_level, 32);
  EXPECT_EQ(state->capacity, 40);
}

TEST(BucketStateTest, ParseCallLimit_EmptyAndFull) {
  auto empty = ParseCallLimit("0/80");
  ASSERT_TRUE(empty.has_value());
  EXPECT_EQ(empty->current_fill_level, 0);
  EXPECT_EQ(empty->capacity, 80);

  auto full = ParseCallLimit("40/40");
  ASSERT_TRUE(full.has_value());
  EXPECT_EQ(full->current_fill_level, 40);
}

TEST(BucketStateTest, ParseCallLimit_ToleratesWhitespace) {
  auto state = ParseCallLimit(" 5 / 40\t");
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(*state, (BucketState{40, 5}));
}

TEST(BucketStateTest, ParseCallLimit_Malformed) {
  EXPECT_FALSE(ParseCallLimit("").has_value());
  EXPECT_FALSE(ParseCallLimit("bad").has_value());
  EXPECT_FALSE(ParseCallLimit("32").has_value());
  EXPECT_FALSE(ParseCallLimit("1/2/3").has_value());
  EXPECT_FALSE(ParseCallLimit("a/40").has_value());
  EXPECT_FALSE(ParseCallLimit("32/4x").has_value());
  EXPECT_FALSE(ParseCallLimit("/40").has_value());
}

TEST(BucketStateTest, ParseCallLimit_OutOfRange) {
  EXPECT_FALSE(ParseCallLimit("41/40").has_value());
  EXPECT_FALSE(ParseCallLimit("-1/40").has_value());
  EXPECT_FALSE(ParseCallLimit("5/0").has_value());
  EXPECT_FALSE(ParseCallLimit("0/-40").has_value());
}

TEST(BucketStateTest, FormatCallLimit) {
  EXPECT_EQ(FormatCallLimit(BucketState{40, 32}), "32/40");
  EXPECT_EQ(*ParseCallLimit(FormatCallLimit(BucketState{80, 7})), (BucketState{80, 7}));
}

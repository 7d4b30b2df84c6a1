#include "message.hpp"
#include <gtest/gtest.h>
#include <set>

TEST(FixedMessage, CyclesDigits) {
  EXPECT_EQ(make_fixed_message(13), "0123456789012");
  EXPECT_EQ(make_fixed_message(1), "0");
}

TEST(FixedMessage, LengthMatchesSize) {
  for (int size : {0, 1, 9, 10, 11, 1024, 65536}) {
    std::string m = make_fixed_message(size);
    ASSERT_EQ(m.size(), static_cast<size_t>(size));
    for (size_t i = 0; i < m.size(); ++i) ASSERT_EQ(m[i], static_cast<char>('0' + i % 10));
  }
}

TEST(FixedMessage, EmptyForZeroOrNegative) {
  EXPECT_TRUE(make_fixed_message(0).empty());
  EXPECT_TRUE(make_fixed_message(-5).empty());
}

TEST(Topic, EmbedsDecimalIndices) {
  EXPECT_EQ(topic_for("/mqtt-bench/benchmark", 12, 345), "/mqtt-bench/benchmark/12/345");
  EXPECT_EQ(client_id_for("mqtt-benchmark", 42), "mqtt-benchmark42");
}

TEST(Topic, DistinctForEveryClientIterationPair) {
  std::set<std::string> seen;
  for (int c = 0; c < 120; ++c)
    for (int i = 0; i < 120; ++i)
      ASSERT_TRUE(seen.insert(topic_for("/t", c, i)).second) << c << "/" << i;
  // 1/11 and 11/1 would collide without a separator
  EXPECT_NE(topic_for("/t", 1, 11), topic_for("/t", 11, 1));
}

TEST(ClientId, DistinctPerIndex) {
  std::set<std::string> ids;
  for (int c = 0; c < 1000; ++c) ASSERT_TRUE(ids.insert(client_id_for("mqtt-benchmark", c)).second);
}

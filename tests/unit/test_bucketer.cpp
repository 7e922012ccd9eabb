#include <gtest/gtest.h>
#include "flagkit/bucketer.hpp"
#include <set>
#include <string>

namespace flagkit {

class BucketerTest : public ::testing::Test {};

TEST_F(BucketerTest, HashInputUsesDefaultSeed) {
    EXPECT_EQ(Bucketer::hashInput("test_flag", "user-123", std::nullopt),
              "devbolt:test_flag:user-123");
    EXPECT_EQ(Bucketer::hashInput("test_flag", "user-123", std::string("s1")),
              "s1:test_flag:user-123");
}

TEST_F(BucketerTest, EmptySeedCountsAsNoSeed) {
    EXPECT_EQ(Bucketer::hashInput("f", "id", std::string("")), "devbolt:f:id");
    EXPECT_EQ(Bucketer::bucket("test_flag", "user-123", std::string("")),
              Bucketer::bucket("test_flag", "user-123"));
}

TEST_F(BucketerTest, KnownBuckets) {
    // SHA-256("devbolt:test_flag:user-123") starts with 75bc232d.
    EXPECT_EQ(Bucketer::bucket("test_flag", "user-123"), 45);
    EXPECT_EQ(Bucketer::bucket("test_flag", "user-123", std::string("seed1")), 57);
    EXPECT_EQ(Bucketer::bucket("test_flag", "user-123", std::string("custom")), 80);
    EXPECT_EQ(Bucketer::bucket("rollout_flag", "user-123"), 45);
    EXPECT_EQ(Bucketer::bucket("rollout_flag", "anonymous"), 70);
    EXPECT_EQ(Bucketer::bucket("rollout_flag", "alice@example.com"), 12);
}

TEST_F(BucketerTest, Deterministic) {
    int first = Bucketer::bucket("checkout", "user-42");
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(Bucketer::bucket("checkout", "user-42"), first);
    }
}

TEST_F(BucketerTest, FlagNameChangesBucket) {
    EXPECT_EQ(Bucketer::bucket("other_flag", "user-123"), 21);
    EXPECT_NE(Bucketer::bucket("other_flag", "user-123"),
              Bucketer::bucket("test_flag", "user-123"));
}

TEST_F(BucketerTest, BucketsStayInRangeAndSpread) {
    std::set<int> seen;
    for (int i = 0; i < 1000; ++i) {
        int bucket = Bucketer::bucket("dist_flag", "user-" + std::to_string(i));
        ASSERT_GE(bucket, 0);
        ASSERT_LE(bucket, 99);
        seen.insert(bucket);
    }
    EXPECT_GT(seen.size(), 50u);
}

TEST_F(BucketerTest, RolloutEdges) {
    for (int i = 0; i < 200; ++i) {
        std::string id = "user-" + std::to_string(i);
        EXPECT_FALSE(Bucketer::isInRollout("edge_flag", id, 0.0));
        EXPECT_TRUE(Bucketer::isInRollout("edge_flag", id, 100.0));
    }
}

TEST_F(BucketerTest, RolloutComparesBucketStrictly) {
    // bucket("test_flag", "user-123") == 45
    EXPECT_TRUE(Bucketer::isInRollout("test_flag", "user-123", 46.0));
    EXPECT_TRUE(Bucketer::isInRollout("test_flag", "user-123", 45.5));
    EXPECT_FALSE(Bucketer::isInRollout("test_flag", "user-123", 45.0));
    EXPECT_FALSE(Bucketer::isInRollout("test_flag", "user-123", 30.0));
}

TEST_F(BucketerTest, SeedChangesRolloutMembership) {
    // 45 without a seed, 57 with "seed1"
    EXPECT_TRUE(Bucketer::isInRollout("test_flag", "user-123", 50.0));
    EXPECT_FALSE(Bucketer::isInRollout("test_flag", "user-123", 50.0,
                                       std::string("seed1")));
}

TEST_F(BucketerTest, HandlesUnicodeIdentifiers) {
    int bucket = Bucketer::bucket("test_flag", "\xc3\xbc\x73\x65\x72");
    EXPECT_GE(bucket, 0);
    EXPECT_LE(bucket, 99);
    EXPECT_EQ(bucket, Bucketer::bucket("test_flag", "\xc3\xbc\x73\x65\x72"));
}

} // namespace flagkit

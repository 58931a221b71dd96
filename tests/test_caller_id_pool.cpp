// =============================================================================
// FILE: tests/test_caller_id_pool.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "dialer/caller_id_pool.h"

using namespace turbo_dialer;

TEST(CallerIdPool, MatchesLeadAreaCode) {
    CallerIdPool pool("+15550000000", {"+15125550101", "+12125550102"});
    EXPECT_EQ(pool.pick("+15129990000"), "+15125550101");
    EXPECT_EQ(pool.pick("+12129990000"), "+12125550102");
    EXPECT_EQ(pool.size(), 2u);
}

TEST(CallerIdPool, FallsBackToDefault) {
    CallerIdPool pool("+15550000000", {"+15125550101"});
    EXPECT_EQ(pool.pick("+13035550100"), "+15550000000");
    EXPECT_EQ(pool.pick("+442079460958"), "+15550000000");
}

TEST(CallerIdPool, SameLeadSameNumber) {
    CallerIdPool pool("+15550000000", {"+15125550101", "+15125550102", "+15125550103"});
    std::string first = pool.pick("+15129990000");
    for (int i = 0; i < 10; ++i) EXPECT_EQ(pool.pick("+15129990000"), first);
}

TEST(CallerIdPool, InvalidEntriesSkipped) {
    CallerIdPool pool("512-555-0199", {"not a number", "(212) 555-0102"});
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.default_number(), "+15125550199");
}

TEST(CallerIdPool, DefaultTakenFromPoolWhenMissing) {
    CallerIdPool pool("", {"+15125550101"});
    EXPECT_EQ(pool.default_number(), "+15125550101");

    CallerIdPool empty("", {});
    EXPECT_TRUE(empty.default_number().empty());
}

// =============================================================================
// FILE: tests/test_rep_pool.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "persistence/memory_stores.h"

#include <atomic>
#include <thread>
#include <vector>

using namespace turbo_dialer;

class RepPoolTest : public ::testing::Test {
protected:
    RepSession open(const std::string& rep_id, const OrgId& org = "org1") {
        RepSession s;
        EXPECT_EQ(pool_.open_session(org, rep_id, s), Result::kOk);
        return s;
    }

    MemoryRepPool pool_;
};

TEST_F(RepPoolTest, OpenSessionIsIdempotentPerRep) {
    RepSession a = open("rep1");
    RepSession b = open("rep1");
    EXPECT_EQ(a.session_id, b.session_id);
    EXPECT_EQ(b.availability, RepAvailability::kAvailable);

    RepSession other_org = open("rep1", "org2");
    EXPECT_NE(other_org.session_id, a.session_id);

    RepSession bad;
    EXPECT_EQ(pool_.open_session("org1", "", bad), Result::kInvalidArgument);
}

TEST_F(RepPoolTest, EmptyPoolReturnsNotAvailable) {
    RepClaim claim;
    EXPECT_EQ(pool_.claim_available_rep("org1", "CA1", claim), Result::kNotAvailable);

    open("rep1", "org2");
    EXPECT_EQ(pool_.claim_available_rep("org1", "CA1", claim), Result::kNotAvailable);
}

TEST_F(RepPoolTest, ClaimGeneratesConference) {
    RepSession s = open("rep1");
    RepClaim claim;
    ASSERT_EQ(pool_.claim_available_rep("org1", "CA1", claim), Result::kOk);
    EXPECT_EQ(claim.session_id, s.session_id);
    EXPECT_EQ(claim.rep_id, "rep1");
    EXPECT_EQ(claim.conference_name.rfind("turbo-org1-rep1-", 0), 0u);

    RepSession now;
    pool_.get(s.session_id, now);
    EXPECT_EQ(now.availability, RepAvailability::kClaimed);
    EXPECT_EQ(now.claimed_call_handle, "CA1");
    EXPECT_EQ(now.conference_name, claim.conference_name);

    RepClaim second;
    EXPECT_EQ(pool_.claim_available_rep("org1", "CA2", second), Result::kNotAvailable);
}

TEST_F(RepPoolTest, ConcurrentClaimsAgainstOneRep) {
    open("rep1");

    constexpr int kRacers = 16;
    std::atomic<int> wins{0};
    std::atomic<int> misses{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < kRacers; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load()) std::this_thread::yield();
            RepClaim claim;
            Result r = pool_.claim_available_rep("org1", "CA" + std::to_string(i), claim);
            if (r == Result::kOk) wins++;
            else if (r == Result::kNotAvailable) misses++;
        });
    }
    go.store(true);
    for (auto& t : threads) t.join();

    EXPECT_EQ(wins.load(), 1);
    EXPECT_EQ(misses.load(), kRacers - 1);
}

TEST_F(RepPoolTest, LongestIdleRepClaimedFirst) {
    open("rep1");
    open("rep2");

    RepClaim c;
    ASSERT_EQ(pool_.claim_available_rep("org1", "CA1", c), Result::kOk);
    std::string first = c.rep_id;
    ASSERT_EQ(pool_.release_rep(c.session_id), Result::kOk);

    // The rep that just finished goes to the back of the line
    RepClaim next;
    ASSERT_EQ(pool_.claim_available_rep("org1", "CA2", next), Result::kOk);
    EXPECT_NE(next.rep_id, first);
}

TEST_F(RepPoolTest, ReleaseIsIdempotent) {
    RepSession s = open("rep1");
    RepClaim c;
    pool_.claim_available_rep("org1", "CA1", c);

    EXPECT_EQ(pool_.release_rep(s.session_id), Result::kOk);
    EXPECT_EQ(pool_.release_rep(s.session_id), Result::kNotFound);
    EXPECT_EQ(pool_.release_rep("no-such-session"), Result::kNotFound);

    RepSession now;
    pool_.get(s.session_id, now);
    EXPECT_EQ(now.availability, RepAvailability::kAvailable);
    EXPECT_TRUE(now.conference_name.empty());
    EXPECT_TRUE(now.claimed_call_handle.empty());
    EXPECT_GT(now.last_released_at, 0);
}

TEST_F(RepPoolTest, ReleaseGuardedByConference) {
    RepSession s = open("rep1");
    RepClaim first;
    pool_.claim_available_rep("org1", "CA1", first);
    pool_.release_rep(s.session_id, first.conference_name);

    std::this_thread::sleep_for(Millisecs(2));
    RepClaim second;
    ASSERT_EQ(pool_.claim_available_rep("org1", "CA2", second), Result::kOk);
    ASSERT_NE(first.conference_name, second.conference_name);

    // Late event from the first call must not free the second claim
    EXPECT_EQ(pool_.release_rep(s.session_id, first.conference_name), Result::kNotFound);
    RepSession now;
    pool_.get(s.session_id, now);
    EXPECT_EQ(now.availability, RepAvailability::kClaimed);
    EXPECT_EQ(now.claimed_call_handle, "CA2");
}

TEST_F(RepPoolTest, CountersAndQueries) {
    RepSession s = open("rep1");
    open("rep2");
    open("rep3", "org2");

    size_t avail = 0;
    pool_.count_available("org1", avail);
    EXPECT_EQ(avail, 2u);

    EXPECT_EQ(pool_.increment_dialed(s.session_id, 3), Result::kOk);
    EXPECT_EQ(pool_.increment_connected(s.session_id), Result::kOk);
    RepSession now;
    pool_.get(s.session_id, now);
    EXPECT_EQ(now.calls_dialed, 3u);
    EXPECT_EQ(now.connected_call_count, 1u);

    std::vector<OrgId> orgs;
    pool_.active_orgs(orgs);
    EXPECT_EQ(orgs.size(), 2u);

    EXPECT_EQ(pool_.close_session(s.session_id), Result::kOk);
    EXPECT_EQ(pool_.close_session(s.session_id), Result::kNotFound);
    EXPECT_EQ(pool_.increment_connected(s.session_id), Result::kNotFound);
}

TEST_F(RepPoolTest, StaleClaimsListedByAge) {
    RepSession s = open("rep1");
    RepClaim c;
    pool_.claim_available_rep("org1", "CA1", c);

    std::vector<RepSession> stale;
    pool_.list_stale_claims(now_epoch_ms() - 60000, stale);
    EXPECT_TRUE(stale.empty());

    pool_.list_stale_claims(now_epoch_ms() + 1, stale);
    ASSERT_EQ(stale.size(), 1u);
    EXPECT_EQ(stale[0].session_id, s.session_id);
}

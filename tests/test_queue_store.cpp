// =============================================================================
// FILE: tests/test_queue_store.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "persistence/memory_stores.h"

#include <algorithm>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace turbo_dialer;

class QueueStoreTest : public ::testing::Test {
protected:
    QueueStoreTest() : store_(RetryPolicy{3, Seconds(0)}) {}

    std::string enqueue_one(const std::string& lead_id, const std::string& phone,
                            int priority = 0) {
        QueueStore::EnqueueSummary s;
        EXPECT_EQ(store_.enqueue("org1", {{lead_id, phone, "Lead " + lead_id}},
                                 priority, "crm", s), Result::kOk);
        std::vector<QueueEntry> all;
        store_.list("org1", all);
        for (const auto& e : all) if (e.lead_id == lead_id) return e.id;
        return "";
    }

    MemoryQueueStore store_;
};

TEST_F(QueueStoreTest, EnqueueNormalizesAndRejects) {
    QueueStore::EnqueueSummary s;
    std::vector<LeadRef> leads = {
        {"L1", "(512) 555-0101", "Ann"},
        {"L2", "12", "Bad phone"},
        {"", "5125550103", "No id"},
    };
    ASSERT_EQ(store_.enqueue("org1", leads, 0, "crm", s), Result::kOk);
    EXPECT_EQ(s.inserted, 1u);
    EXPECT_EQ(s.rejected, 2u);

    std::vector<QueueEntry> all;
    store_.list("org1", all);
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].lead_phone, "+15125550101");
    EXPECT_EQ(all[0].status, QueueStatus::kQueued);
}

TEST_F(QueueStoreTest, EnqueueIsIdempotentPerLead) {
    std::string id = enqueue_one("L1", "5125550101", 1);

    QueueStore::EnqueueSummary s;
    store_.enqueue("org1", {{"L1", "5125550101", ""}}, 5, "crm", s);
    EXPECT_EQ(s.inserted, 0u);
    EXPECT_EQ(s.refreshed, 1u);

    std::vector<QueueEntry> all;
    store_.list("org1", all);
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].id, id);
    EXPECT_EQ(all[0].priority, 5);
    EXPECT_EQ(all[0].lead_name, "Lead L1");  // empty name keeps the stored one
}

TEST_F(QueueStoreTest, EnqueueWithoutOrgRejected) {
    QueueStore::EnqueueSummary s;
    EXPECT_EQ(store_.enqueue("", {{"L1", "5125550101", ""}}, 0, "crm", s),
              Result::kInvalidArgument);
}

TEST_F(QueueStoreTest, NextBatchOrdersByPriorityThenAge) {
    enqueue_one("low", "5125550101", 0);
    std::this_thread::sleep_for(Millisecs(2));
    enqueue_one("high", "5125550102", 10);
    std::this_thread::sleep_for(Millisecs(2));
    enqueue_one("low2", "5125550103", 0);

    std::vector<QueueEntry> batch;
    ASSERT_EQ(store_.next_batch("org1", 2, batch), Result::kOk);
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch[0].lead_id, "high");
    EXPECT_EQ(batch[1].lead_id, "low");
    EXPECT_EQ(batch[0].status, QueueStatus::kDialing);

    std::vector<QueueEntry> rest;
    store_.next_batch("org1", 10, rest);
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0].lead_id, "low2");
}

TEST_F(QueueStoreTest, ConcurrentNextBatchNeverHandsOutTwice) {
    for (int i = 0; i < 200; ++i) {
        enqueue_one("L" + std::to_string(i), "51255" + std::to_string(10000 + i));
    }

    std::mutex mu;
    std::vector<std::string> seen;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int round = 0; round < 10; ++round) {
                std::vector<QueueEntry> batch;
                store_.next_batch("org1", 7, batch);
                std::lock_guard<std::mutex> lk(mu);
                for (const auto& e : batch) seen.push_back(e.id);
            }
        });
    }
    for (auto& t : threads) t.join();

    std::set<std::string> unique(seen.begin(), seen.end());
    EXPECT_EQ(unique.size(), seen.size());
    EXPECT_EQ(seen.size(), 200u);
}

TEST_F(QueueStoreTest, RetryBoundStopsAfterLimit) {
    std::string id = enqueue_one("L1", "5125550101");

    for (int dial = 1; dial <= 3; ++dial) {
        std::vector<QueueEntry> batch;
        store_.next_batch("org1", 1, batch);
        ASSERT_EQ(batch.size(), 1u) << "dial " << dial;
        QueueEntry after;
        ASSERT_EQ(store_.mark_outcome(id, Disposition::kNoAnswer, &after), Result::kOk);
        EXPECT_EQ(after.attempt_count, dial);
    }

    QueueEntry e;
    store_.get(id, e);
    EXPECT_EQ(e.status, QueueStatus::kFailed);
    EXPECT_EQ(e.attempt_count, 3);

    // No fourth dial
    std::vector<QueueEntry> batch;
    store_.next_batch("org1", 1, batch);
    EXPECT_TRUE(batch.empty());
}

TEST_F(QueueStoreTest, MarkOutcomeReplayIsNoOp) {
    std::string id = enqueue_one("L1", "5125550101");
    std::vector<QueueEntry> batch;
    store_.next_batch("org1", 1, batch);

    ASSERT_EQ(store_.mark_outcome(id, Disposition::kBusy), Result::kOk);
    ASSERT_EQ(store_.mark_outcome(id, Disposition::kBusy), Result::kOk);

    QueueEntry e;
    store_.get(id, e);
    EXPECT_EQ(e.status, QueueStatus::kQueued);
    EXPECT_EQ(e.attempt_count, 1);
}

TEST_F(QueueStoreTest, CooldownHoldsEntryBack) {
    MemoryQueueStore slow(RetryPolicy{3, Seconds(3600)});
    QueueStore::EnqueueSummary s;
    slow.enqueue("org1", {{"L1", "5125550101", ""}}, 0, "crm", s);

    std::vector<QueueEntry> batch;
    slow.next_batch("org1", 1, batch);
    ASSERT_EQ(batch.size(), 1u);
    slow.mark_outcome(batch[0].id, Disposition::kNoAnswer);

    std::vector<QueueEntry> again;
    slow.next_batch("org1", 1, again);
    EXPECT_TRUE(again.empty());
}

TEST_F(QueueStoreTest, RequeueDoesNotConsumeAttempt) {
    std::string id = enqueue_one("L1", "5125550101");
    std::vector<QueueEntry> batch;
    store_.next_batch("org1", 1, batch);

    ASSERT_EQ(store_.requeue(id), Result::kOk);
    QueueEntry e;
    store_.get(id, e);
    EXPECT_EQ(e.status, QueueStatus::kQueued);
    EXPECT_EQ(e.attempt_count, 0);
    EXPECT_EQ(e.last_disposition, "canceled");

    EXPECT_EQ(store_.requeue(id), Result::kConflict);
}

TEST_F(QueueStoreTest, AdvanceIsForwardOnly) {
    std::string id = enqueue_one("L1", "5125550101");
    EXPECT_EQ(store_.advance(id, QueueStatus::kRinging), Result::kConflict);  // not in flight

    std::vector<QueueEntry> batch;
    store_.next_batch("org1", 1, batch);
    EXPECT_EQ(store_.advance(id, QueueStatus::kAnswered), Result::kOk);
    EXPECT_EQ(store_.advance(id, QueueStatus::kRinging), Result::kConflict);
}

TEST_F(QueueStoreTest, TerminalEntryRequeuedOnEnqueue) {
    std::string id = enqueue_one("L1", "5125550101");
    std::vector<QueueEntry> batch;
    store_.next_batch("org1", 1, batch);
    store_.mark_outcome(id, Disposition::kCompleted);

    QueueStore::EnqueueSummary s;
    store_.enqueue("org1", {{"L1", "5125550101", ""}}, 0, "crm", s);
    EXPECT_EQ(s.requeued, 1u);

    QueueEntry e;
    store_.get(id, e);
    EXPECT_EQ(e.status, QueueStatus::kQueued);
    EXPECT_EQ(e.attempt_count, 0);
}

TEST_F(QueueStoreTest, RemoveAndClear) {
    enqueue_one("L1", "5125550101");
    enqueue_one("L2", "5125550102");
    enqueue_one("L3", "5125550103");

    EXPECT_EQ(store_.remove("org1", "L1"), Result::kOk);
    EXPECT_EQ(store_.remove("org1", "L1"), Result::kNotFound);

    std::vector<QueueEntry> batch;
    store_.next_batch("org1", 1, batch);  // one in flight survives the clear

    size_t removed = 0;
    ASSERT_EQ(store_.clear_queued("org1", removed), Result::kOk);
    EXPECT_EQ(removed, 1u);

    std::map<std::string, size_t> counts;
    store_.count_by_status("org1", counts);
    EXPECT_EQ(counts["dialing"], 1u);
    EXPECT_EQ(counts["queued"], 0u);
}

// =============================================================================
// FILE: tests/test_voicemail_finisher.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "dialer/voicemail_finisher.h"
#include "persistence/memory_stores.h"

using namespace turbo_dialer;

class VoicemailFinisherTest : public ::testing::Test {
protected:
    VoicemailFinisherTest()
        : queue_(RetryPolicy{3, Seconds(0)})
        , finisher_(VoicemailFinisher::Dependencies{&queue_, &calls_})
    {}

    void SetUp() override {
        QueueStore::EnqueueSummary s;
        ASSERT_EQ(queue_.enqueue("org1", {{"L1", "5125550100", ""}}, 0, "crm", s), Result::kOk);
        std::vector<QueueEntry> batch;
        ASSERT_EQ(queue_.next_batch("org1", 1, batch), Result::kOk);
        ASSERT_EQ(batch.size(), 1u);
        entry_id_ = batch[0].id;

        CallAttempt a;
        a.call_handle = "CA1";
        a.queue_entry_id = entry_id_;
        a.org_id = "org1";
        a.lead_id = "L1";
        a.batch_id = "B1";
        ASSERT_EQ(calls_.create(a), Result::kOk);

        CallUpdate hold{CallStatus::kHolding};
        hold.claim_failures = 1;
        ASSERT_EQ(calls_.transition("CA1", hold), Result::kOk);
        CallUpdate vm{CallStatus::kVoicemail};
        vm.claim_failures = 2;
        ASSERT_EQ(calls_.transition("CA1", vm), Result::kOk);
    }

    CallAttempt call() {
        CallAttempt a;
        EXPECT_EQ(calls_.get("CA1", a), Result::kOk);
        return a;
    }

    MemoryQueueStore queue_;
    MemoryCallAttemptStore calls_;
    VoicemailFinisher finisher_;
    std::string entry_id_;
};

TEST_F(VoicemailFinisherTest, RecordingAttachedAndEntryCompleted) {
    VoiceResponse vr = finisher_.handle_recording("CA1", "https://rec.example.com/RE1");
    EXPECT_TRUE(vr.has(VoiceResponse::Verb::kSay));
    EXPECT_TRUE(vr.has(VoiceResponse::Verb::kHangup));

    EXPECT_EQ(call().voicemail_url, "https://rec.example.com/RE1");
    QueueEntry e;
    ASSERT_EQ(queue_.get(entry_id_, e), Result::kOk);
    EXPECT_EQ(e.status, QueueStatus::kCompleted);
    EXPECT_EQ(e.last_disposition, "voicemail");
    EXPECT_EQ(finisher_.stats().recordings.load(), 1u);
}

TEST_F(VoicemailFinisherTest, TranscriptionStoredOnlyWhenCompleted) {
    finisher_.handle_recording("CA1", "https://rec.example.com/RE1");

    EXPECT_EQ(finisher_.handle_transcription("CA1", "garbled", "failed"), Result::kOk);
    EXPECT_TRUE(call().voicemail_transcription.empty());

    EXPECT_EQ(finisher_.handle_transcription("CA1", "Please call me back", "completed"),
              Result::kOk);
    CallAttempt a = call();
    EXPECT_EQ(a.voicemail_transcription, "Please call me back");
    EXPECT_EQ(a.voicemail_url, "https://rec.example.com/RE1");
    EXPECT_EQ(finisher_.stats().transcriptions_skipped.load(), 1u);
}

TEST_F(VoicemailFinisherTest, UnknownCallStillSaysGoodbye) {
    VoiceResponse vr = finisher_.handle_recording("CA-nope", "https://rec.example.com/RE9");
    EXPECT_TRUE(vr.has(VoiceResponse::Verb::kHangup));
    EXPECT_EQ(finisher_.handle_transcription("CA-nope", "hi", "completed"), Result::kOk);
    EXPECT_EQ(finisher_.stats().untracked.load(), 2u);
}

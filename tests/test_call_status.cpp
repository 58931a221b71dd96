// =============================================================================
// FILE: tests/test_call_status.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "model/call_attempt.h"
#include "model/queue_entry.h"
#include "persistence/call_attempt_store.h"

using namespace turbo_dialer;

TEST(CallStatus, ForwardOnly) {
    EXPECT_TRUE(can_transition(CallStatus::kDialing, CallStatus::kRinging));
    EXPECT_TRUE(can_transition(CallStatus::kRinging, CallStatus::kAnswered));
    EXPECT_TRUE(can_transition(CallStatus::kAnswered, CallStatus::kHolding));
    EXPECT_TRUE(can_transition(CallStatus::kHolding, CallStatus::kConnected));
    EXPECT_TRUE(can_transition(CallStatus::kHolding, CallStatus::kVoicemail));
    EXPECT_TRUE(can_transition(CallStatus::kDialing, CallStatus::kConnected));

    // Late progress after the call moved on
    EXPECT_FALSE(can_transition(CallStatus::kConnected, CallStatus::kRinging));
    EXPECT_FALSE(can_transition(CallStatus::kAnswered, CallStatus::kAnswered));
    EXPECT_FALSE(can_transition(CallStatus::kConnected, CallStatus::kVoicemail));
}

TEST(CallStatus, TerminalIsSticky) {
    EXPECT_TRUE(can_transition(CallStatus::kConnected, CallStatus::kCompleted));
    EXPECT_TRUE(can_transition(CallStatus::kDialing, CallStatus::kCanceled));
    EXPECT_FALSE(can_transition(CallStatus::kCompleted, CallStatus::kCompleted));
    EXPECT_FALSE(can_transition(CallStatus::kCanceled, CallStatus::kCompleted));
    EXPECT_FALSE(can_transition(CallStatus::kNoAnswer, CallStatus::kRinging));
}

TEST(CallStatus, DispositionFromTerminal) {
    EXPECT_EQ(disposition_for(CallStatus::kConnected, CallStatus::kCompleted), Disposition::kCompleted);
    EXPECT_EQ(disposition_for(CallStatus::kVoicemail, CallStatus::kCompleted), Disposition::kVoicemail);
    EXPECT_EQ(disposition_for(CallStatus::kRinging, CallStatus::kNoAnswer), Disposition::kNoAnswer);
    EXPECT_EQ(disposition_for(CallStatus::kDialing, CallStatus::kBusy), Disposition::kBusy);
    EXPECT_EQ(disposition_for(CallStatus::kAnswered, CallStatus::kMachine), Disposition::kMachine);
    EXPECT_EQ(disposition_for(CallStatus::kDialing, CallStatus::kCanceled), Disposition::kFailed);
}

TEST(CallStatus, ProviderVocabulary) {
    EXPECT_EQ(map_provider_status("initiated"), CallStatus::kDialing);
    EXPECT_EQ(map_provider_status("ringing"), CallStatus::kRinging);
    EXPECT_EQ(map_provider_status("in-progress"), CallStatus::kAnswered);
    EXPECT_EQ(map_provider_status("no-answer"), CallStatus::kNoAnswer);
    EXPECT_EQ(map_provider_status("canceled"), CallStatus::kCanceled);
    EXPECT_FALSE(map_provider_status("warming-up").has_value());
}

TEST(CallStatus, AnsweredBy) {
    EXPECT_TRUE(is_machine(parse_answered_by("machine_start")));
    EXPECT_TRUE(is_machine(parse_answered_by("machine_end_beep")));
    EXPECT_TRUE(is_machine(parse_answered_by("fax")));
    EXPECT_FALSE(is_machine(parse_answered_by("human")));
    EXPECT_FALSE(is_machine(parse_answered_by("unknown")));
    EXPECT_FALSE(is_machine(parse_answered_by("")));
}

TEST(CallStatus, AllowedPredecessorsRespectsOnlyFrom) {
    auto from = allowed_predecessors(CallStatus::kCanceled,
                                     {CallStatus::kDialing, CallStatus::kRinging});
    ASSERT_EQ(from.size(), 2u);

    auto voicemail = allowed_predecessors(CallStatus::kVoicemail, {CallStatus::kHolding});
    ASSERT_EQ(voicemail.size(), 1u);
    EXPECT_EQ(voicemail[0], CallStatus::kHolding);
}

TEST(CallStatus, ApplyUpdateKeepsUnsetFields) {
    CallAttempt a;
    a.status = CallStatus::kRinging;
    a.ringing_at = 100;
    a.assigned_rep_id = "";

    CallUpdate u{CallStatus::kConnected};
    u.connected_at = 200;
    u.assigned_rep_id = "rep1";
    u.is_first_answer = true;
    apply_call_update(a, u);

    EXPECT_EQ(a.status, CallStatus::kConnected);
    EXPECT_EQ(a.ringing_at, 100);
    EXPECT_EQ(a.connected_at, 200);
    EXPECT_EQ(a.assigned_rep_id, "rep1");
    EXPECT_TRUE(a.is_first_answer);
}

TEST(QueueOutcome, RetryBound) {
    RetryPolicy policy{3, Seconds(0)};
    QueueEntry e;
    e.status = QueueStatus::kDialing;

    auto u1 = compute_outcome(e, Disposition::kNoAnswer, policy, 1000);
    EXPECT_EQ(u1.status, QueueStatus::kQueued);
    EXPECT_EQ(u1.attempt_count, 1);

    e.attempt_count = 2;
    auto u3 = compute_outcome(e, Disposition::kNoAnswer, policy, 1000);
    EXPECT_EQ(u3.status, QueueStatus::kFailed);
    EXPECT_EQ(u3.attempt_count, 3);
    EXPECT_EQ(u3.last_disposition, "no_answer");
}

TEST(QueueOutcome, NonRetryableCompletesWithoutCountingAttempt) {
    RetryPolicy policy{3, Seconds(0)};
    QueueEntry e;
    e.status = QueueStatus::kAnswered;
    e.attempt_count = 1;

    for (auto d : {Disposition::kCompleted, Disposition::kMachine, Disposition::kVoicemail}) {
        auto u = compute_outcome(e, d, policy, 1000);
        EXPECT_EQ(u.status, QueueStatus::kCompleted);
        EXPECT_EQ(u.attempt_count, 1);
    }
}

TEST(QueueOutcome, CooldownDelaysNextAttempt) {
    RetryPolicy policy{3, Seconds(60)};
    QueueEntry e;
    e.status = QueueStatus::kDialing;
    auto u = compute_outcome(e, Disposition::kBusy, policy, 1000);
    EXPECT_EQ(u.next_attempt_after, 61000);
}

// =============================================================================
// FILE: tests/test_answer_handler.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "dialer/answer_handler.h"
#include "dialer/dispatch_launcher.h"
#include "dialer/rep_connector.h"
#include "dialer/caller_id_pool.h"
#include "persistence/memory_stores.h"
#include "common/slow_handler_logger.h"
#include "fakes/fake_telephony_provider.h"
#include "fakes/fake_crm_gateway.h"

#include <map>

using namespace turbo_dialer;
using fakes::FakeTelephonyProvider;
using fakes::FakeCrmGateway;

class AnswerHandlerTest : public ::testing::Test {
protected:
    AnswerHandlerTest()
        : config_(make_config())
        , queue_(RetryPolicy{3, Seconds(0)})
        , caller_ids_("+15550000000", {})
        , slow_logger_(config_)
        , launcher_(config_, DispatchLauncher::Dependencies{
              &queue_, &reps_, &calls_, &provider_, &caller_ids_, &slow_logger_})
        , connector_(config_, RepConnector::Dependencies{&reps_, &provider_})
        , answer_(config_, AnswerHandler::Dependencies{
              &queue_, &reps_, &calls_, &provider_, &crm_, &connector_})
    {}

    static Config make_config() {
        Config c;
        c.leads_per_rep = 3;
        c.hold_pause = Seconds(2);
        c.public_base_url = "https://dialer.example.com";
        return c;
    }

    // Queues L1..L3, opens R1 and dials one batch; returns lead_id -> call handle.
    std::map<std::string, std::string> dial_batch() {
        QueueStore::EnqueueSummary s;
        queue_.enqueue("org1", {{"L1", "5125550101", "Ann"},
                                {"L2", "5125550102", "Bob"},
                                {"L3", "5125550103", "Cy"}}, 0, "crm", s);
        reps_.open_session("org1", "R1", rep_);

        DispatchReport report;
        EXPECT_EQ(launcher_.run_dispatch_cycle("org1", report), Result::kOk);
        EXPECT_EQ(report.dialed, 3u);
        batch_id_ = report.batch_id;

        std::map<std::string, std::string> by_lead;
        for (const auto& h : report.call_handles) {
            CallAttempt a;
            calls_.get(h, a);
            by_lead[a.lead_id] = h;
        }
        return by_lead;
    }

    // Takes R1 so no rep is left for the answer path.
    void occupy_rep() {
        RepClaim c;
        ASSERT_EQ(reps_.claim_available_rep("org1", "CA-other", c), Result::kOk);
    }

    CallAttempt call(const std::string& handle) {
        CallAttempt a;
        EXPECT_EQ(calls_.get(handle, a), Result::kOk);
        return a;
    }

    QueueEntry entry_of(const std::string& handle) {
        QueueEntry e;
        EXPECT_EQ(queue_.get(call(handle).queue_entry_id, e), Result::kOk);
        return e;
    }

    Config config_;
    MemoryQueueStore queue_;
    MemoryRepPool reps_;
    MemoryCallAttemptStore calls_;
    FakeTelephonyProvider provider_;
    FakeCrmGateway crm_;
    CallerIdPool caller_ids_;
    SlowHandlerLogger slow_logger_;
    DispatchLauncher launcher_;
    RepConnector connector_;
    AnswerHandler answer_;
    RepSession rep_;
    std::string batch_id_;
};

TEST_F(AnswerHandlerTest, FirstHumanAnswerConvergesBatch) {
    auto calls = dial_batch();
    const std::string l2 = calls["L2"];

    VoiceResponse vr = answer_.handle_answer(l2, "human");

    // Bridged into R1's fresh conference
    const auto* dial = vr.find(VoiceResponse::Verb::kDialConference);
    ASSERT_NE(dial, nullptr);
    RepSession r1;
    reps_.get(rep_.session_id, r1);
    EXPECT_EQ(r1.availability, RepAvailability::kClaimed);
    EXPECT_EQ(r1.claimed_call_handle, l2);
    EXPECT_EQ(dial->text, r1.conference_name);
    EXPECT_EQ(r1.conference_name.rfind("turbo-org1-R1-", 0), 0u);
    EXPECT_NE(VoiceResponse::attribute(*dial, "statusCallback").find(rep_.session_id),
              std::string::npos);

    CallAttempt winner = call(l2);
    EXPECT_EQ(winner.status, CallStatus::kConnected);
    EXPECT_TRUE(winner.is_first_answer);
    EXPECT_EQ(winner.assigned_rep_id, "R1");
    EXPECT_EQ(winner.session_id, rep_.session_id);
    EXPECT_EQ(entry_of(l2).status, QueueStatus::kAnswered);

    // Siblings canceled at the provider and back in the queue without losing an attempt
    for (const auto& lead : {"L1", "L3"}) {
        const std::string& h = calls[lead];
        EXPECT_EQ(call(h).status, CallStatus::kCanceled) << lead;
        QueueEntry e = entry_of(h);
        EXPECT_EQ(e.status, QueueStatus::kQueued) << lead;
        EXPECT_EQ(e.attempt_count, 0) << lead;
    }
    EXPECT_EQ(provider_.canceled.size(), 2u);

    ASSERT_EQ(crm_.owners.size(), 1u);
    EXPECT_EQ(crm_.owners[0].lead_id, "L2");
    EXPECT_EQ(crm_.owners[0].rep_id, "R1");
    EXPECT_EQ(crm_.created.size(), 1u);

    // R1's own leg rang, pointed at the same conference
    ASSERT_EQ(provider_.placed.size(), 4u);
    const PlaceCallRequest& leg = provider_.placed.back();
    EXPECT_EQ(leg.to, "client:R1");
    EXPECT_FALSE(leg.detect_machine);
    EXPECT_NE(leg.answer_url.find("session_id=" + rep_.session_id), std::string::npos);
    EXPECT_NE(leg.answer_url.find("conference=" + r1.conference_name), std::string::npos);
    EXPECT_NE(leg.status_callback_url.find("/turbo/rep-leg-status"), std::string::npos);

    VoiceResponse join = connector_.join_document(rep_.session_id, r1.conference_name);
    const auto* rep_dial = join.find(VoiceResponse::Verb::kDialConference);
    ASSERT_NE(rep_dial, nullptr);
    EXPECT_EQ(rep_dial->text, dial->text);
    EXPECT_EQ(VoiceResponse::attribute(*rep_dial, "startConferenceOnEnter"), "true");
    EXPECT_EQ(VoiceResponse::attribute(*rep_dial, "endConferenceOnExit"), "true");
    EXPECT_EQ(VoiceResponse::attribute(*dial, "startConferenceOnEnter"), "false");
}

TEST_F(AnswerHandlerTest, RepLegNotPlacedHoldsLeadAndFreesRep) {
    auto calls = dial_batch();
    provider_.reject_to.insert("client:R1");
    const std::string l1 = calls["L1"];

    VoiceResponse vr = answer_.handle_answer(l1, "human");
    EXPECT_FALSE(vr.has(VoiceResponse::Verb::kDialConference));
    EXPECT_TRUE(vr.has(VoiceResponse::Verb::kRedirect));
    EXPECT_EQ(call(l1).status, CallStatus::kHolding);
    EXPECT_EQ(answer_.stats().rep_legs_failed.load(), 1u);
    EXPECT_EQ(connector_.stats().legs_failed.load(), 1u);

    RepSession r1;
    reps_.get(rep_.session_id, r1);
    EXPECT_EQ(r1.availability, RepAvailability::kAvailable);
    EXPECT_TRUE(r1.conference_name.empty());

    // Siblings keep ringing; nobody won the batch
    EXPECT_TRUE(provider_.canceled.empty());
    EXPECT_TRUE(crm_.owners.empty());
}

TEST_F(AnswerHandlerTest, DuplicateAnswerReissuesSameBridge) {
    auto calls = dial_batch();
    VoiceResponse first = answer_.handle_answer(calls["L2"], "human");
    VoiceResponse again = answer_.handle_answer(calls["L2"], "human");

    EXPECT_EQ(first.to_xml(), again.to_xml());
    EXPECT_EQ(answer_.stats().duplicates.load(), 1u);
    EXPECT_EQ(answer_.stats().connected.load(), 1u);
    EXPECT_EQ(crm_.owners.size(), 1u);
}

TEST_F(AnswerHandlerTest, MachineNeverClaimsRep) {
    auto calls = dial_batch();
    const std::string l1 = calls["L1"];

    VoiceResponse vr = answer_.handle_answer(l1, "machine_start");
    EXPECT_TRUE(vr.has(VoiceResponse::Verb::kHangup));
    EXPECT_FALSE(vr.has(VoiceResponse::Verb::kDialConference));

    EXPECT_EQ(call(l1).status, CallStatus::kMachine);
    EXPECT_EQ(entry_of(l1).status, QueueStatus::kCompleted);
    EXPECT_EQ(entry_of(l1).last_disposition, "machine");

    RepSession r1;
    reps_.get(rep_.session_id, r1);
    EXPECT_EQ(r1.availability, RepAvailability::kAvailable);
    EXPECT_TRUE(provider_.canceled.empty());
    EXPECT_EQ(call(calls["L2"]).status, CallStatus::kDialing);
}

TEST_F(AnswerHandlerTest, HoldThenVoicemail) {
    auto calls = dial_batch();
    occupy_rep();
    const std::string l3 = calls["L3"];

    VoiceResponse hold = answer_.handle_answer(l3, "human");
    ASSERT_TRUE(hold.has(VoiceResponse::Verb::kSay));
    const auto* pause = hold.find(VoiceResponse::Verb::kPause);
    ASSERT_NE(pause, nullptr);
    EXPECT_EQ(VoiceResponse::attribute(*pause, "length"), "2");
    const auto* redirect = hold.find(VoiceResponse::Verb::kRedirect);
    ASSERT_NE(redirect, nullptr);
    EXPECT_EQ(redirect->text, "https://dialer.example.com/turbo/lead-answered");

    CallAttempt held = call(l3);
    EXPECT_EQ(held.status, CallStatus::kHolding);
    EXPECT_EQ(held.claim_failures, 1);

    // Redirect after the pause: still no rep
    VoiceResponse vm = answer_.handle_answer(l3, "human");
    const auto* record = vm.find(VoiceResponse::Verb::kRecord);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(VoiceResponse::attribute(*record, "transcribe"), "true");
    EXPECT_NE(VoiceResponse::attribute(*record, "action").find(l3), std::string::npos);
    EXPECT_EQ(call(l3).status, CallStatus::kVoicemail);
    EXPECT_EQ(call(l3).claim_failures, 2);
    EXPECT_EQ(entry_of(l3).status, QueueStatus::kCompleted);
    EXPECT_EQ(entry_of(l3).last_disposition, "voicemail");

    // Never a third try
    VoiceResponse third = answer_.handle_answer(l3, "human");
    EXPECT_TRUE(third.has(VoiceResponse::Verb::kRecord));
    EXPECT_EQ(answer_.stats().holds.load(), 1u);
    EXPECT_EQ(answer_.stats().voicemails.load(), 1u);
    EXPECT_EQ(entry_of(l3).status, QueueStatus::kCompleted);
}

TEST_F(AnswerHandlerTest, HeldLeadConnectsWhenRepFrees) {
    auto calls = dial_batch();
    occupy_rep();
    const std::string l1 = calls["L1"];

    answer_.handle_answer(l1, "human");
    ASSERT_EQ(call(l1).status, CallStatus::kHolding);

    ASSERT_EQ(reps_.release_rep(rep_.session_id), Result::kOk);
    VoiceResponse vr = answer_.handle_answer(l1, "machine_start");  // detection ignored after hold
    EXPECT_TRUE(vr.has(VoiceResponse::Verb::kDialConference));
    EXPECT_EQ(call(l1).status, CallStatus::kConnected);
    EXPECT_TRUE(call(l1).is_first_answer);
}

TEST_F(AnswerHandlerTest, UntrackedCallHangsUp) {
    VoiceResponse vr = answer_.handle_answer("CA-unknown", "human");
    EXPECT_TRUE(vr.has(VoiceResponse::Verb::kHangup));
    EXPECT_EQ(answer_.stats().untracked.load(), 1u);
}

// =============================================================================
// FILE: tests/test_webhook_handler.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "http/webhook_handler.h"
#include "dialer/answer_handler.h"
#include "dialer/lifecycle_processor.h"
#include "dialer/voicemail_finisher.h"
#include "dialer/rep_connector.h"
#include "persistence/memory_stores.h"
#include "common/slow_handler_logger.h"
#include "fakes/fake_telephony_provider.h"
#include "fakes/fake_crm_gateway.h"

using namespace turbo_dialer;

namespace {

const std::string kEmptyDoc = R"(<?xml version="1.0" encoding="UTF-8"?><Response></Response>)";

HttpServer::Request post(const std::string& path, const std::string& body,
                         const std::string& query_key = "", const std::string& query_val = "") {
    HttpServer::Request req;
    req.method = "POST";
    req.path = path;
    req.body = body;
    req.headers["content-type"] = "application/x-www-form-urlencoded";
    if (!query_key.empty()) req.query_params[query_key] = query_val;
    return req;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

class WebhookHandlerTest : public ::testing::Test {
protected:
    WebhookHandlerTest()
        : config_(make_config())
        , queue_(RetryPolicy{3, Seconds(0)})
        , slow_logger_(config_)
        , connector_(config_, RepConnector::Dependencies{&reps_, &provider_})
        , answer_(config_, AnswerHandler::Dependencies{&queue_, &reps_, &calls_, &provider_, &crm_,
                                                       &connector_})
        , lifecycle_(LifecycleProcessor::Dependencies{&queue_, &reps_, &calls_, &crm_})
        , voicemail_(VoicemailFinisher::Dependencies{&queue_, &calls_})
        , deps_{&answer_, &lifecycle_, &voicemail_, &slow_logger_, &connector_}
    {}

    static Config make_config() {
        Config c;
        c.public_base_url = "https://dialer.example.com";
        return c;
    }

    void SetUp() override {
        QueueStore::EnqueueSummary s;
        ASSERT_EQ(queue_.enqueue("org1", {{"L1", "5125550100", "Ann"}}, 0, "crm", s), Result::kOk);
        std::vector<QueueEntry> batch;
        ASSERT_EQ(queue_.next_batch("org1", 1, batch), Result::kOk);
        ASSERT_EQ(batch.size(), 1u);

        CallAttempt a;
        a.call_handle = "CA1";
        a.queue_entry_id = batch[0].id;
        a.org_id = "org1";
        a.lead_id = "L1";
        a.batch_id = "B1";
        ASSERT_EQ(calls_.create(a), Result::kOk);
    }

    CallAttempt call() {
        CallAttempt a;
        EXPECT_EQ(calls_.get("CA1", a), Result::kOk);
        return a;
    }

    Config config_;
    MemoryQueueStore queue_;
    MemoryRepPool reps_;
    MemoryCallAttemptStore calls_;
    fakes::FakeTelephonyProvider provider_;
    fakes::FakeCrmGateway crm_;
    SlowHandlerLogger slow_logger_;
    RepConnector connector_;
    AnswerHandler answer_;
    LifecycleProcessor lifecycle_;
    VoicemailFinisher voicemail_;
    WebhookHandler::Dependencies deps_;
};

TEST_F(WebhookHandlerTest, LeadAnsweredBridgesToRep) {
    RepSession rep;
    ASSERT_EQ(reps_.open_session("org1", "R1", rep), Result::kOk);

    auto resp = WebhookHandler::handle_lead_answered(
        post("/turbo/lead-answered", "CallSid=CA1&AnsweredBy=human&To=%2B15125550100"), deps_);
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.content_type, "text/xml");
    EXPECT_TRUE(contains(resp.body, "<Dial><Conference"));
    EXPECT_TRUE(contains(resp.body, "session_id=" + rep.session_id));
    EXPECT_EQ(call().status, CallStatus::kConnected);
    EXPECT_EQ(slow_logger_.stats().timed_count.load(), 1u);
}

TEST_F(WebhookHandlerTest, LeadAnsweredWithoutCallSidApologizes) {
    auto resp = WebhookHandler::handle_lead_answered(
        post("/turbo/lead-answered", "AnsweredBy=human"), deps_);
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_TRUE(contains(resp.body, "<Say"));
    EXPECT_TRUE(contains(resp.body, "<Hangup/>"));
}

TEST_F(WebhookHandlerTest, CallStatusAnswersEmptyDocument) {
    auto resp = WebhookHandler::handle_call_status(
        post("/turbo/call-status", "CallSid=CA1&CallStatus=no-answer&CallDuration=abc"), deps_);
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.body, kEmptyDoc);
    EXPECT_EQ(call().status, CallStatus::kNoAnswer);

    // Unknown calls and missing fields still get a 200
    resp = WebhookHandler::handle_call_status(
        post("/turbo/call-status", "CallSid=CA-other&CallStatus=completed"), deps_);
    EXPECT_EQ(resp.status_code, 200);
    resp = WebhookHandler::handle_call_status(post("/turbo/call-status", ""), deps_);
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.body, kEmptyDoc);
}

TEST_F(WebhookHandlerTest, CallStatusDurationRecorded) {
    WebhookHandler::handle_call_status(
        post("/turbo/call-status", "CallSid=CA1&CallStatus=in-progress"), deps_);
    WebhookHandler::handle_call_status(
        post("/turbo/call-status", "CallSid=CA1&CallStatus=completed&CallDuration=61"), deps_);
    EXPECT_EQ(call().status, CallStatus::kCompleted);
    EXPECT_EQ(call().duration_sec, 61);
}

TEST_F(WebhookHandlerTest, ConferenceLeaveReadsSessionFromQuery) {
    RepSession rep;
    ASSERT_EQ(reps_.open_session("org1", "R1", rep), Result::kOk);
    WebhookHandler::handle_lead_answered(
        post("/turbo/lead-answered", "CallSid=CA1&AnsweredBy=human"), deps_);

    auto resp = WebhookHandler::handle_conference_status(
        post("/turbo/conference-status", "StatusCallbackEvent=participant-leave&CallSid=CA1",
             "session_id", rep.session_id), deps_);
    EXPECT_EQ(resp.status_code, 200);

    RepSession after;
    ASSERT_EQ(reps_.get(rep.session_id, after), Result::kOk);
    EXPECT_EQ(after.availability, RepAvailability::kAvailable);
}

TEST_F(WebhookHandlerTest, RepLegJoinsLeadConference) {
    RepSession rep;
    ASSERT_EQ(reps_.open_session("org1", "R1", rep), Result::kOk);
    auto lead = WebhookHandler::handle_lead_answered(
        post("/turbo/lead-answered", "CallSid=CA1&AnsweredBy=human"), deps_);

    RepSession claimed;
    ASSERT_EQ(reps_.get(rep.session_id, claimed), Result::kOk);
    ASSERT_EQ(claimed.availability, RepAvailability::kClaimed);
    const std::string conf = claimed.conference_name;
    EXPECT_TRUE(contains(lead.body, ">" + conf + "</Conference>"));

    ASSERT_EQ(provider_.placed.size(), 1u);
    EXPECT_EQ(provider_.placed[0].to, "client:R1");

    // The provider fetches the rep leg's answer URL
    auto req = post("/turbo/session/twiml", "CallSid=CA0001&CallStatus=in-progress",
                    "session_id", rep.session_id);
    req.query_params["conference"] = conf;
    auto join = WebhookHandler::handle_session_join(req, deps_);
    EXPECT_EQ(join.status_code, 200);
    EXPECT_EQ(join.content_type, "text/xml");
    EXPECT_TRUE(contains(join.body, R"(startConferenceOnEnter="true")"));
    EXPECT_TRUE(contains(join.body, R"(endConferenceOnExit="true")"));
    EXPECT_TRUE(contains(join.body, ">" + conf + "</Conference>"));

    // The rep hangs up; the claim is freed and the session stays open
    req = post("/turbo/rep-leg-status", "CallSid=CA0001&CallStatus=completed",
               "session_id", rep.session_id);
    req.query_params["conference"] = conf;
    auto status = WebhookHandler::handle_rep_leg_status(req, deps_);
    EXPECT_EQ(status.status_code, 200);
    EXPECT_EQ(status.body, kEmptyDoc);

    RepSession after;
    ASSERT_EQ(reps_.get(rep.session_id, after), Result::kOk);
    EXPECT_EQ(after.availability, RepAvailability::kAvailable);
}

TEST_F(WebhookHandlerTest, SessionJoinWithoutSessionHangsUp) {
    auto resp = WebhookHandler::handle_session_join(post("/turbo/session/twiml", ""), deps_);
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_TRUE(contains(resp.body, "<Hangup/>"));
    EXPECT_FALSE(contains(resp.body, "<Conference"));
}

TEST_F(WebhookHandlerTest, ConferenceEndKeepsSessionOpen) {
    RepSession rep;
    ASSERT_EQ(reps_.open_session("org1", "R1", rep), Result::kOk);
    WebhookHandler::handle_lead_answered(
        post("/turbo/lead-answered", "CallSid=CA1&AnsweredBy=human"), deps_);
    RepSession claimed;
    ASSERT_EQ(reps_.get(rep.session_id, claimed), Result::kOk);

    auto resp = WebhookHandler::handle_conference_status(
        post("/turbo/conference-status",
             "StatusCallbackEvent=conference-end&FriendlyName=" + claimed.conference_name,
             "session_id", rep.session_id), deps_);
    EXPECT_EQ(resp.status_code, 200);

    RepSession after;
    ASSERT_EQ(reps_.get(rep.session_id, after), Result::kOk);
    EXPECT_EQ(after.availability, RepAvailability::kAvailable);
    EXPECT_EQ(lifecycle_.stats().conferences_ended.load(), 1u);
}

TEST_F(WebhookHandlerTest, VoicemailRecordingAndTranscription) {
    auto resp = WebhookHandler::handle_voicemail(
        post("/turbo/voicemail", "RecordingUrl=https%3A%2F%2Frec.example.com%2FRE1&CallSid=CA1",
             "call_handle", "CA1"), deps_);
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_TRUE(contains(resp.body, "Thank you. Goodbye."));
    EXPECT_EQ(call().voicemail_url, "https://rec.example.com/RE1");

    resp = WebhookHandler::handle_transcription(
        post("/turbo/voicemail/transcription",
             "TranscriptionText=call+me+back&TranscriptionStatus=completed",
             "call_handle", "CA1"), deps_);
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.body, kEmptyDoc);
    EXPECT_EQ(call().voicemail_transcription, "call me back");
}

TEST_F(WebhookHandlerTest, RoutesRegistered) {
    HttpServer server(config_);
    WebhookHandler::register_routes(server, deps_);

    auto req = post("/turbo/call-status", "CallSid=CA1&CallStatus=ringing");
    auto resp = server.dispatch(req);
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(call().status, CallStatus::kRinging);

    req.method = "GET";
    EXPECT_EQ(server.dispatch(req).status_code, 405);

    for (const char* path : {"/turbo/session/twiml", "/turbo/rep-leg-status"}) {
        EXPECT_EQ(server.dispatch(post(path, "")).status_code, 200) << path;
    }
}

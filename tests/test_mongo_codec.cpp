// =============================================================================
// FILE: tests/test_mongo_codec.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "persistence/mongo_codec.h"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/types.hpp>

using namespace turbo_dialer;
using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

namespace {

CallAttempt full_attempt() {
    CallAttempt a;
    a.call_handle     = "CA0001";
    a.queue_entry_id  = "QE-1";
    a.org_id          = "org1";
    a.lead_id         = "L1";
    a.batch_id        = "B1";
    a.status          = CallStatus::kConnected;
    a.caller_id       = "+15550000000";
    a.to_number       = "+15125550101";
    a.assigned_rep_id = "R1";
    a.session_id      = "S1";
    a.conference_name = "turbo-org1-R1-1700000000000";
    a.is_first_answer = true;
    a.claim_failures  = 1;
    a.created_at      = 1700000000000;
    a.ringing_at      = 1700000001000;
    a.answered_at     = 1700000005000;
    a.connected_at    = 1700000005200;
    a.ended_at        = 1700000065200;
    a.duration_sec    = 60;
    a.recording_url   = "https://rec.example.com/RE1";
    a.voicemail_url   = "https://rec.example.com/RE2";
    a.voicemail_transcription = "call me back";
    return a;
}

void expect_same(const CallAttempt& a, const CallAttempt& b) {
    EXPECT_EQ(a.call_handle, b.call_handle);
    EXPECT_EQ(a.queue_entry_id, b.queue_entry_id);
    EXPECT_EQ(a.org_id, b.org_id);
    EXPECT_EQ(a.lead_id, b.lead_id);
    EXPECT_EQ(a.batch_id, b.batch_id);
    EXPECT_EQ(a.status, b.status);
    EXPECT_EQ(a.caller_id, b.caller_id);
    EXPECT_EQ(a.to_number, b.to_number);
    EXPECT_EQ(a.assigned_rep_id, b.assigned_rep_id);
    EXPECT_EQ(a.session_id, b.session_id);
    EXPECT_EQ(a.conference_name, b.conference_name);
    EXPECT_EQ(a.is_first_answer, b.is_first_answer);
    EXPECT_EQ(a.claim_failures, b.claim_failures);
    EXPECT_EQ(a.created_at, b.created_at);
    EXPECT_EQ(a.ringing_at, b.ringing_at);
    EXPECT_EQ(a.answered_at, b.answered_at);
    EXPECT_EQ(a.connected_at, b.connected_at);
    EXPECT_EQ(a.ended_at, b.ended_at);
    EXPECT_EQ(a.duration_sec, b.duration_sec);
    EXPECT_EQ(a.recording_url, b.recording_url);
    EXPECT_EQ(a.voicemail_url, b.voicemail_url);
    EXPECT_EQ(a.voicemail_transcription, b.voicemail_transcription);
}

void expect_same(const RepSession& a, const RepSession& b) {
    EXPECT_EQ(a.session_id, b.session_id);
    EXPECT_EQ(a.rep_id, b.rep_id);
    EXPECT_EQ(a.org_id, b.org_id);
    EXPECT_EQ(a.availability, b.availability);
    EXPECT_EQ(a.conference_name, b.conference_name);
    EXPECT_EQ(a.claimed_call_handle, b.claimed_call_handle);
    EXPECT_EQ(a.claimed_at, b.claimed_at);
    EXPECT_EQ(a.started_at, b.started_at);
    EXPECT_EQ(a.last_released_at, b.last_released_at);
    EXPECT_EQ(a.calls_dialed, b.calls_dialed);
    EXPECT_EQ(a.connected_call_count, b.connected_call_count);
}

} // namespace

TEST(MongoCodec, CallAttemptRoundTrip) {
    CallAttempt in = full_attempt();
    auto doc = mongo_codec::encode_call_attempt(in);
    expect_same(mongo_codec::decode_call_attempt(doc.view()), in);

    // Every terminal status survives the string form
    for (CallStatus s : {CallStatus::kBusy, CallStatus::kNoAnswer, CallStatus::kCanceled,
                         CallStatus::kVoicemail, CallStatus::kMachine}) {
        in.status = s;
        auto d = mongo_codec::encode_call_attempt(in);
        EXPECT_EQ(mongo_codec::decode_call_attempt(d.view()).status, s)
            << call_status_to_string(s);
    }
}

TEST(MongoCodec, CallAttemptWithEmptyOptionalFields) {
    // A freshly dialed call: no rep, no conference, no timestamps past creation
    CallAttempt in;
    in.call_handle = "CA0002";
    in.org_id      = "org1";
    in.lead_id     = "L2";
    in.created_at  = 1700000000000;

    auto doc = mongo_codec::encode_call_attempt(in);
    CallAttempt out = mongo_codec::decode_call_attempt(doc.view());
    expect_same(out, in);
    EXPECT_EQ(out.status, CallStatus::kDialing);
    EXPECT_TRUE(out.session_id.empty());
    EXPECT_TRUE(out.conference_name.empty());
    EXPECT_EQ(out.connected_at, 0);
    EXPECT_FALSE(out.is_first_answer);
}

TEST(MongoCodec, RepSessionRoundTrip) {
    RepSession claimed;
    claimed.session_id           = "S1";
    claimed.rep_id               = "R1";
    claimed.org_id               = "org1";
    claimed.availability         = RepAvailability::kClaimed;
    claimed.conference_name      = "turbo-org1-R1-1700000000000";
    claimed.claimed_call_handle  = "CA0001";
    claimed.claimed_at           = 1700000005000;
    claimed.started_at           = 1699999990000;
    claimed.last_released_at     = 1699999999000;
    claimed.calls_dialed         = 42;
    claimed.connected_call_count = 7;
    auto doc = mongo_codec::encode_rep_session(claimed);
    expect_same(mongo_codec::decode_rep_session(doc.view()), claimed);

    // Just opened: never claimed, first in line
    RepSession fresh;
    fresh.session_id = "S2";
    fresh.rep_id     = "R2";
    fresh.org_id     = "org1";
    fresh.started_at = 1700000000000;
    doc = mongo_codec::encode_rep_session(fresh);
    RepSession out = mongo_codec::decode_rep_session(doc.view());
    expect_same(out, fresh);
    EXPECT_EQ(out.availability, RepAvailability::kAvailable);
    EXPECT_EQ(out.last_released_at, 0);
}

TEST(MongoCodec, QueueEntryDecodesStoredShape) {
    // Field types as the enqueue upsert writes them (priority and attempts as int32)
    auto doc = make_document(
        kvp("_id", "QE-1"),
        kvp("org_id", "org1"),
        kvp("lead_id", "L1"),
        kvp("lead_phone", "+15125550101"),
        kvp("lead_name", "Ann"),
        kvp("priority", 5),
        kvp("status", "no_answer"),
        kvp("added_at", static_cast<int64_t>(1700000000000)),
        kvp("added_by", "crm"),
        kvp("last_attempt_at", static_cast<int64_t>(1700000100000)),
        kvp("last_disposition", "no_answer"),
        kvp("attempt_count", 2),
        kvp("next_attempt_after", static_cast<int64_t>(1700000400000)));

    QueueEntry e = mongo_codec::decode_queue_entry(doc.view());
    EXPECT_EQ(e.id, "QE-1");
    EXPECT_EQ(e.org_id, "org1");
    EXPECT_EQ(e.lead_id, "L1");
    EXPECT_EQ(e.lead_phone, "+15125550101");
    EXPECT_EQ(e.lead_name, "Ann");
    EXPECT_EQ(e.priority, 5);
    EXPECT_EQ(e.status, QueueStatus::kNoAnswer);
    EXPECT_EQ(e.added_at, 1700000000000);
    EXPECT_EQ(e.added_by, "crm");
    EXPECT_EQ(e.last_attempt_at, 1700000100000);
    EXPECT_EQ(e.last_disposition, "no_answer");
    EXPECT_EQ(e.attempt_count, 2);
    EXPECT_EQ(e.next_attempt_after, 1700000400000);
}

TEST(MongoCodec, QueueEntryMissingFieldsDefault) {
    auto doc = make_document(kvp("_id", "QE-2"), kvp("org_id", "org1"), kvp("lead_id", "L2"),
                             kvp("lead_phone", "+15125550102"), kvp("status", "queued"),
                             kvp("lead_name", ""), kvp("priority", 2.0));

    QueueEntry e = mongo_codec::decode_queue_entry(doc.view());
    EXPECT_EQ(e.id, "QE-2");
    EXPECT_TRUE(e.lead_name.empty());
    EXPECT_TRUE(e.added_by.empty());
    EXPECT_TRUE(e.last_disposition.empty());
    EXPECT_EQ(e.priority, 2);
    EXPECT_EQ(e.status, QueueStatus::kQueued);
    EXPECT_EQ(e.attempt_count, 0);
    EXPECT_EQ(e.last_attempt_at, 0);
    EXPECT_EQ(e.next_attempt_after, 0);
}

TEST(MongoCodec, WrongTypesReadAsEmpty) {
    auto doc = make_document(kvp("_id", 17), kvp("status", true), kvp("claimed_at", "soon"),
                             kvp("is_first_answer", 1));
    EXPECT_EQ(mongo_codec::get_string(doc.view(), "_id"), "");
    EXPECT_EQ(mongo_codec::get_int64(doc.view(), "claimed_at"), 0);
    EXPECT_FALSE(mongo_codec::get_bool(doc.view(), "is_first_answer"));
    EXPECT_EQ(mongo_codec::get_string(doc.view(), "absent"), "");
}

TEST(MongoCodec, CallUpdateSetsOnlyCarriedFields) {
    CallUpdate u{CallStatus::kRinging};
    u.ringing_at = 1700000001000;
    auto doc = mongo_codec::call_update_to_set(u);
    auto set = doc.view()["$set"].get_document().view();

    EXPECT_EQ(mongo_codec::get_string(set, "status"), "ringing");
    EXPECT_EQ(mongo_codec::get_int64(set, "ringing_at"), 1700000001000);
    EXPECT_FALSE(set["connected_at"]);
    EXPECT_FALSE(set["session_id"]);
    EXPECT_FALSE(set["conference_name"]);
    EXPECT_FALSE(set["is_first_answer"]);
    EXPECT_FALSE(set["claim_failures"]);

    // An explicit false or zero still lands when the optional is set
    CallUpdate held{CallStatus::kHolding};
    held.is_first_answer = false;
    held.claim_failures = 0;
    doc = mongo_codec::call_update_to_set(held);
    set = doc.view()["$set"].get_document().view();
    ASSERT_TRUE(set["is_first_answer"]);
    EXPECT_FALSE(set["is_first_answer"].get_bool().value);
    ASSERT_TRUE(set["claim_failures"]);
    EXPECT_EQ(mongo_codec::get_int64(set, "claim_failures"), 0);
}

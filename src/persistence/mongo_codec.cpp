// =============================================================================
// FILE: src/persistence/mongo_codec.cpp
// =============================================================================
#include "persistence/mongo_codec.h"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/array.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/types.hpp>

namespace turbo_dialer {
namespace mongo_codec {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;
using bsoncxx::builder::basic::sub_document;

std::string get_string(bsoncxx::document::view doc, const char* key) {
    auto el = doc[key];
    if (!el || el.type() != bsoncxx::type::k_string) return "";
    auto sv = el.get_string().value;
    return std::string(sv.data(), sv.size());
}

int64_t get_int64(bsoncxx::document::view doc, const char* key) {
    auto el = doc[key];
    if (!el) return 0;
    switch (el.type()) {
        case bsoncxx::type::k_int64:  return el.get_int64().value;
        case bsoncxx::type::k_int32:  return el.get_int32().value;
        case bsoncxx::type::k_double: return static_cast<int64_t>(el.get_double().value);
        default:                      return 0;
    }
}

bool get_bool(bsoncxx::document::view doc, const char* key) {
    auto el = doc[key];
    return el && el.type() == bsoncxx::type::k_bool && el.get_bool().value;
}

QueueEntry decode_queue_entry(bsoncxx::document::view doc) {
    QueueEntry e;
    e.id                 = get_string(doc, "_id");
    e.org_id             = get_string(doc, "org_id");
    e.lead_id            = get_string(doc, "lead_id");
    e.lead_phone         = get_string(doc, "lead_phone");
    e.lead_name          = get_string(doc, "lead_name");
    e.priority           = static_cast<int>(get_int64(doc, "priority"));
    e.status             = queue_status_from_string(get_string(doc, "status"));
    e.added_at           = get_int64(doc, "added_at");
    e.added_by           = get_string(doc, "added_by");
    e.last_attempt_at    = get_int64(doc, "last_attempt_at");
    e.last_disposition   = get_string(doc, "last_disposition");
    e.attempt_count      = static_cast<int>(get_int64(doc, "attempt_count"));
    e.next_attempt_after = get_int64(doc, "next_attempt_after");
    return e;
}

CallAttempt decode_call_attempt(bsoncxx::document::view doc) {
    CallAttempt a;
    a.call_handle     = get_string(doc, "_id");
    a.queue_entry_id  = get_string(doc, "queue_entry_id");
    a.org_id          = get_string(doc, "org_id");
    a.lead_id         = get_string(doc, "lead_id");
    a.batch_id        = get_string(doc, "batch_id");
    a.status          = call_status_from_string(get_string(doc, "status"));
    a.caller_id       = get_string(doc, "caller_id");
    a.to_number       = get_string(doc, "to_number");
    a.assigned_rep_id = get_string(doc, "assigned_rep_id");
    a.session_id      = get_string(doc, "session_id");
    a.conference_name = get_string(doc, "conference_name");
    a.is_first_answer = get_bool(doc, "is_first_answer");
    a.claim_failures  = static_cast<int>(get_int64(doc, "claim_failures"));
    a.created_at      = get_int64(doc, "created_at");
    a.ringing_at      = get_int64(doc, "ringing_at");
    a.answered_at     = get_int64(doc, "answered_at");
    a.connected_at    = get_int64(doc, "connected_at");
    a.ended_at        = get_int64(doc, "ended_at");
    a.duration_sec    = static_cast<int>(get_int64(doc, "duration_sec"));
    a.recording_url   = get_string(doc, "recording_url");
    a.voicemail_url   = get_string(doc, "voicemail_url");
    a.voicemail_transcription = get_string(doc, "voicemail_transcription");
    return a;
}

RepSession decode_rep_session(bsoncxx::document::view doc) {
    RepSession s;
    s.session_id           = get_string(doc, "_id");
    s.rep_id               = get_string(doc, "rep_id");
    s.org_id               = get_string(doc, "org_id");
    s.availability         = availability_from_string(get_string(doc, "availability"));
    s.conference_name      = get_string(doc, "conference_name");
    s.claimed_call_handle  = get_string(doc, "claimed_call_handle");
    s.claimed_at           = get_int64(doc, "claimed_at");
    s.started_at           = get_int64(doc, "started_at");
    s.last_released_at     = get_int64(doc, "last_released_at");
    s.calls_dialed         = static_cast<uint64_t>(get_int64(doc, "calls_dialed"));
    s.connected_call_count = static_cast<uint64_t>(get_int64(doc, "connected_call_count"));
    return s;
}

bsoncxx::document::value encode_call_attempt(const CallAttempt& a) {
    return make_document(
        kvp("_id", a.call_handle),
        kvp("queue_entry_id", a.queue_entry_id),
        kvp("org_id", a.org_id),
        kvp("lead_id", a.lead_id),
        kvp("batch_id", a.batch_id),
        kvp("status", call_status_to_string(a.status)),
        kvp("caller_id", a.caller_id),
        kvp("to_number", a.to_number),
        kvp("assigned_rep_id", a.assigned_rep_id),
        kvp("session_id", a.session_id),
        kvp("conference_name", a.conference_name),
        kvp("is_first_answer", a.is_first_answer),
        kvp("claim_failures", static_cast<int32_t>(a.claim_failures)),
        kvp("created_at", static_cast<int64_t>(a.created_at)),
        kvp("ringing_at", static_cast<int64_t>(a.ringing_at)),
        kvp("answered_at", static_cast<int64_t>(a.answered_at)),
        kvp("connected_at", static_cast<int64_t>(a.connected_at)),
        kvp("ended_at", static_cast<int64_t>(a.ended_at)),
        kvp("duration_sec", static_cast<int32_t>(a.duration_sec)),
        kvp("recording_url", a.recording_url),
        kvp("voicemail_url", a.voicemail_url),
        kvp("voicemail_transcription", a.voicemail_transcription));
}

bsoncxx::document::value encode_rep_session(const RepSession& s) {
    return make_document(
        kvp("_id", s.session_id),
        kvp("rep_id", s.rep_id),
        kvp("org_id", s.org_id),
        kvp("availability", availability_to_string(s.availability)),
        kvp("conference_name", s.conference_name),
        kvp("claimed_call_handle", s.claimed_call_handle),
        kvp("claimed_at", static_cast<int64_t>(s.claimed_at)),
        kvp("started_at", static_cast<int64_t>(s.started_at)),
        kvp("last_released_at", static_cast<int64_t>(s.last_released_at)),
        kvp("calls_dialed", static_cast<int64_t>(s.calls_dialed)),
        kvp("connected_call_count", static_cast<int64_t>(s.connected_call_count)));
}

bsoncxx::document::value call_update_to_set(const CallUpdate& u) {
    return make_document(kvp("$set", [&u](sub_document sd) {
        sd.append(kvp("status", call_status_to_string(u.status)));
        if (u.ringing_at)   sd.append(kvp("ringing_at", static_cast<int64_t>(u.ringing_at)));
        if (u.answered_at)  sd.append(kvp("answered_at", static_cast<int64_t>(u.answered_at)));
        if (u.connected_at) sd.append(kvp("connected_at", static_cast<int64_t>(u.connected_at)));
        if (u.ended_at)     sd.append(kvp("ended_at", static_cast<int64_t>(u.ended_at)));
        if (u.duration_sec) sd.append(kvp("duration_sec", static_cast<int32_t>(u.duration_sec)));
        if (!u.recording_url.empty())   sd.append(kvp("recording_url", u.recording_url));
        if (!u.assigned_rep_id.empty()) sd.append(kvp("assigned_rep_id", u.assigned_rep_id));
        if (!u.session_id.empty())      sd.append(kvp("session_id", u.session_id));
        if (!u.conference_name.empty()) sd.append(kvp("conference_name", u.conference_name));
        if (u.is_first_answer) sd.append(kvp("is_first_answer", *u.is_first_answer));
        if (u.claim_failures)  sd.append(kvp("claim_failures", static_cast<int32_t>(*u.claim_failures)));
    }));
}

bsoncxx::document::value status_in(const std::vector<std::string>& statuses) {
    bsoncxx::builder::basic::array arr;
    for (const auto& s : statuses) arr.append(s);
    return make_document(kvp("$in", arr.extract()));
}

bool is_duplicate_key(const mongocxx::exception& e) {
    return e.code().value() == 11000;
}

} // namespace mongo_codec
} // namespace turbo_dialer

// =============================================================================
// FILE: src/model/call_attempt.cpp
// =============================================================================
#include "model/call_attempt.h"

namespace turbo_dialer {

namespace {

int progress_rank(CallStatus s) {
    switch (s) {
        case CallStatus::kDialing:   return 0;
        case CallStatus::kRinging:   return 1;
        case CallStatus::kAnswered:  return 2;
        case CallStatus::kHolding:   return 3;
        case CallStatus::kConnected: return 4;
        case CallStatus::kVoicemail: return 4;
        default:                     return 5;
    }
}

} // namespace

bool can_transition(CallStatus from, CallStatus to) {
    if (is_terminal(from)) return false;
    if (is_terminal(to)) return true;
    return progress_rank(to) > progress_rank(from);
}

Disposition disposition_for(CallStatus prior, CallStatus terminal) {
    switch (terminal) {
        case CallStatus::kCompleted:
            return prior == CallStatus::kVoicemail ? Disposition::kVoicemail
                                                   : Disposition::kCompleted;
        case CallStatus::kMachine:  return Disposition::kMachine;
        case CallStatus::kBusy:     return Disposition::kBusy;
        case CallStatus::kNoAnswer: return Disposition::kNoAnswer;
        default:                    return Disposition::kFailed;
    }
}

std::optional<CallStatus> map_provider_status(const std::string& s) {
    if (s == "initiated" || s == "queued") return CallStatus::kDialing;
    if (s == "ringing")                    return CallStatus::kRinging;
    if (s == "in-progress" || s == "answered") return CallStatus::kAnswered;
    if (s == "completed")                  return CallStatus::kCompleted;
    if (s == "busy")                       return CallStatus::kBusy;
    if (s == "no-answer")                  return CallStatus::kNoAnswer;
    if (s == "failed")                     return CallStatus::kFailed;
    if (s == "canceled")                   return CallStatus::kCanceled;
    return std::nullopt;
}

AnsweredBy parse_answered_by(const std::string& s) {
    if (s == "human") return AnsweredBy::kHuman;
    if (s == "fax")   return AnsweredBy::kFax;
    if (s.compare(0, 8, "machine_") == 0) return AnsweredBy::kMachine;
    return AnsweredBy::kUnknown;
}

void apply_call_update(CallAttempt& a, const CallUpdate& u) {
    a.status = u.status;
    if (u.ringing_at)   a.ringing_at = u.ringing_at;
    if (u.answered_at)  a.answered_at = u.answered_at;
    if (u.connected_at) a.connected_at = u.connected_at;
    if (u.ended_at)     a.ended_at = u.ended_at;
    if (u.duration_sec) a.duration_sec = u.duration_sec;
    if (!u.recording_url.empty())   a.recording_url = u.recording_url;
    if (!u.assigned_rep_id.empty()) a.assigned_rep_id = u.assigned_rep_id;
    if (!u.session_id.empty())      a.session_id = u.session_id;
    if (!u.conference_name.empty()) a.conference_name = u.conference_name;
    if (u.is_first_answer) a.is_first_answer = *u.is_first_answer;
    if (u.claim_failures)  a.claim_failures = *u.claim_failures;
}

} // namespace turbo_dialer

// =============================================================================
// FILE: include/model/call_attempt.h
// =============================================================================
#ifndef MODEL_CALL_ATTEMPT_H
#define MODEL_CALL_ATTEMPT_H

#include "common/types.h"
#include "model/queue_entry.h"
#include <string>
#include <optional>

namespace turbo_dialer {

enum class CallStatus {
    kDialing, kRinging, kAnswered, kHolding, kConnected, kVoicemail,
    kMachine, kCompleted, kBusy, kNoAnswer, kFailed, kCanceled
};

inline const char* call_status_to_string(CallStatus s) {
    switch (s) {
        case CallStatus::kDialing:   return "dialing";
        case CallStatus::kRinging:   return "ringing";
        case CallStatus::kAnswered:  return "answered";
        case CallStatus::kHolding:   return "holding";
        case CallStatus::kConnected: return "connected";
        case CallStatus::kVoicemail: return "voicemail";
        case CallStatus::kMachine:   return "machine";
        case CallStatus::kCompleted: return "completed";
        case CallStatus::kBusy:      return "busy";
        case CallStatus::kNoAnswer:  return "no_answer";
        case CallStatus::kFailed:    return "failed";
        case CallStatus::kCanceled:  return "canceled";
        default:                     return "unknown";
    }
}

inline CallStatus call_status_from_string(const std::string& s) {
    if (s == "ringing")   return CallStatus::kRinging;
    if (s == "answered")  return CallStatus::kAnswered;
    if (s == "holding")   return CallStatus::kHolding;
    if (s == "connected") return CallStatus::kConnected;
    if (s == "voicemail") return CallStatus::kVoicemail;
    if (s == "machine")   return CallStatus::kMachine;
    if (s == "completed") return CallStatus::kCompleted;
    if (s == "busy")      return CallStatus::kBusy;
    if (s == "no_answer") return CallStatus::kNoAnswer;
    if (s == "failed")    return CallStatus::kFailed;
    if (s == "canceled")  return CallStatus::kCanceled;
    return CallStatus::kDialing;
}

inline bool is_terminal(CallStatus s) {
    switch (s) {
        case CallStatus::kMachine:
        case CallStatus::kCompleted:
        case CallStatus::kBusy:
        case CallStatus::kNoAnswer:
        case CallStatus::kFailed:
        case CallStatus::kCanceled:
            return true;
        default:
            return false;
    }
}

// Not yet picked up; the only states a batch sibling can be canceled from.
inline bool is_pre_answer(CallStatus s) {
    return s == CallStatus::kDialing || s == CallStatus::kRinging;
}

// Terminal is sticky; live states only move forward. Provider events may
// arrive out of order, so a late "ringing" after "connected" is rejected here.
bool can_transition(CallStatus from, CallStatus to);

// Queue disposition for a call that reached `terminal` from `prior`.
Disposition disposition_for(CallStatus prior, CallStatus terminal);

// Provider call-status vocabulary ("in-progress", "no-answer", ...).
std::optional<CallStatus> map_provider_status(const std::string& provider_status);

// Answering-machine detection result attached to the answer callback.
enum class AnsweredBy { kUnknown, kHuman, kMachine, kFax };

AnsweredBy parse_answered_by(const std::string& s);

inline bool is_machine(AnsweredBy a) {
    return a == AnsweredBy::kMachine || a == AnsweredBy::kFax;
}

struct CallAttempt {
    std::string call_handle;
    std::string queue_entry_id;
    OrgId       org_id;
    std::string lead_id;
    std::string batch_id;
    CallStatus  status          = CallStatus::kDialing;
    std::string caller_id;
    std::string to_number;
    std::string assigned_rep_id;
    std::string session_id;
    std::string conference_name;
    bool        is_first_answer = false;
    int         claim_failures  = 0;

    EpochMs     created_at      = 0;
    EpochMs     ringing_at      = 0;
    EpochMs     answered_at     = 0;
    EpochMs     connected_at    = 0;
    EpochMs     ended_at        = 0;
    int         duration_sec    = 0;

    std::string recording_url;
    std::string voicemail_url;
    std::string voicemail_transcription;
};

// Field changes applied together with a status transition. Empty strings and
// zero timestamps mean "leave as is".
struct CallUpdate {
    CallStatus  status;
    EpochMs     ringing_at      = 0;
    EpochMs     answered_at     = 0;
    EpochMs     connected_at    = 0;
    EpochMs     ended_at        = 0;
    int         duration_sec    = 0;
    std::string recording_url;
    std::string assigned_rep_id;
    std::string session_id;
    std::string conference_name;
    std::optional<bool> is_first_answer;
    std::optional<int>  claim_failures;
};

// Applies `update` to `attempt` in place. Shared by the store backends.
void apply_call_update(CallAttempt& attempt, const CallUpdate& update);

} // namespace turbo_dialer
#endif // MODEL_CALL_ATTEMPT_H

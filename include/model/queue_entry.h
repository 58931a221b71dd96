// =============================================================================
// FILE: include/model/queue_entry.h
// =============================================================================
#ifndef MODEL_QUEUE_ENTRY_H
#define MODEL_QUEUE_ENTRY_H

#include "common/types.h"
#include <string>

namespace turbo_dialer {

enum class QueueStatus {
    kQueued, kDialing, kRinging, kAnswered,
    kCompleted, kBusy, kNoAnswer, kFailed
};

inline const char* queue_status_to_string(QueueStatus s) {
    switch (s) {
        case QueueStatus::kQueued:    return "queued";
        case QueueStatus::kDialing:   return "dialing";
        case QueueStatus::kRinging:   return "ringing";
        case QueueStatus::kAnswered:  return "answered";
        case QueueStatus::kCompleted: return "completed";
        case QueueStatus::kBusy:      return "busy";
        case QueueStatus::kNoAnswer:  return "no_answer";
        case QueueStatus::kFailed:    return "failed";
        default:                      return "unknown";
    }
}

inline QueueStatus queue_status_from_string(const std::string& s) {
    if (s == "dialing")   return QueueStatus::kDialing;
    if (s == "ringing")   return QueueStatus::kRinging;
    if (s == "answered")  return QueueStatus::kAnswered;
    if (s == "completed") return QueueStatus::kCompleted;
    if (s == "busy")      return QueueStatus::kBusy;
    if (s == "no_answer") return QueueStatus::kNoAnswer;
    if (s == "failed")    return QueueStatus::kFailed;
    return QueueStatus::kQueued;
}

inline bool is_terminal(QueueStatus s) {
    return s == QueueStatus::kCompleted || s == QueueStatus::kFailed;
}

// A dial is in flight for the entry.
inline bool is_in_flight(QueueStatus s) {
    return s == QueueStatus::kDialing || s == QueueStatus::kRinging ||
           s == QueueStatus::kAnswered;
}

// How a single dial of a queue entry ended.
enum class Disposition {
    kCompleted,   // talked to a rep
    kBusy,
    kNoAnswer,
    kFailed,
    kMachine,     // answering machine / fax, never bridged
    kVoicemail    // human answered, no rep, left a message
};

inline const char* disposition_to_string(Disposition d) {
    switch (d) {
        case Disposition::kCompleted: return "completed";
        case Disposition::kBusy:      return "busy";
        case Disposition::kNoAnswer:  return "no_answer";
        case Disposition::kFailed:    return "failed";
        case Disposition::kMachine:   return "machine";
        case Disposition::kVoicemail: return "voicemail";
        default:                      return "unknown";
    }
}

inline bool is_retryable(Disposition d) {
    return d == Disposition::kBusy || d == Disposition::kNoAnswer ||
           d == Disposition::kFailed;
}

// Lead handed over by the CRM for dialing.
struct LeadRef {
    std::string lead_id;
    std::string phone;
    std::string name;
};

struct QueueEntry {
    std::string id;
    OrgId       org_id;
    std::string lead_id;
    std::string lead_phone;
    std::string lead_name;
    int         priority           = 0;
    QueueStatus status             = QueueStatus::kQueued;
    EpochMs     added_at           = 0;
    std::string added_by;
    EpochMs     last_attempt_at    = 0;
    std::string last_disposition;
    int         attempt_count      = 0;
    EpochMs     next_attempt_after = 0;  // not eligible for NextBatch before this
};

struct RetryPolicy {
    int     retry_limit = 3;
    Seconds cooldown    = Seconds(0);
};

// New bookkeeping for an entry after one dial ended. Shared by every store
// backend so the retry bound is decided in exactly one place.
struct OutcomeUpdate {
    QueueStatus status;
    int         attempt_count;
    EpochMs     next_attempt_after;
    std::string last_disposition;
};

OutcomeUpdate compute_outcome(const QueueEntry& entry, Disposition disposition,
                              const RetryPolicy& policy, EpochMs now);

// Dispatch order: priority desc, then oldest first.
inline bool dials_before(const QueueEntry& a, const QueueEntry& b) {
    if (a.priority != b.priority) return a.priority > b.priority;
    return a.added_at < b.added_at;
}

} // namespace turbo_dialer
#endif // MODEL_QUEUE_ENTRY_H

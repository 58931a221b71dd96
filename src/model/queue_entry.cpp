// =============================================================================
// FILE: src/model/queue_entry.cpp
// =============================================================================
#include "model/queue_entry.h"

namespace turbo_dialer {

OutcomeUpdate compute_outcome(const QueueEntry& entry, Disposition disposition,
                              const RetryPolicy& policy, EpochMs now) {
    OutcomeUpdate u;
    u.last_disposition = disposition_to_string(disposition);
    u.attempt_count = entry.attempt_count;
    u.next_attempt_after = entry.next_attempt_after;

    if (!is_retryable(disposition)) {
        u.status = QueueStatus::kCompleted;
        return u;
    }

    u.attempt_count = entry.attempt_count + 1;
    if (u.attempt_count < policy.retry_limit) {
        u.status = QueueStatus::kQueued;
        u.next_attempt_after = now +
            std::chrono::duration_cast<Millisecs>(policy.cooldown).count();
    } else {
        u.status = QueueStatus::kFailed;
    }
    return u;
}

} // namespace turbo_dialer

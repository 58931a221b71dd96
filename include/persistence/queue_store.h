// =============================================================================
// FILE: include/persistence/queue_store.h
// =============================================================================
#ifndef QUEUE_STORE_H
#define QUEUE_STORE_H

#include "common/types.h"
#include "model/queue_entry.h"
#include <string>
#include <vector>
#include <map>

namespace turbo_dialer {

// Durable queue of leads waiting to be dialed.
//
// Every mutation is a single-document conditional write in the backend:
//   - enqueue:      upsert on (org_id, lead_id)
//   - next_batch:   "status=queued -> dialing" claim per row, no row handed out twice
//   - mark_outcome: compare-and-set on (status, attempt_count) as read
//
// The retry decision (compute_outcome) and the enqueue validation live here,
// the backends only provide the primitive conditional writes.
class QueueStore {
public:
    explicit QueueStore(const RetryPolicy& policy) : policy_(policy) {}
    virtual ~QueueStore() = default;

    struct EnqueueSummary {
        size_t inserted  = 0;
        size_t refreshed = 0;   // already queued or in flight, priority updated
        size_t requeued  = 0;   // terminal entry re-enqueued
        size_t rejected  = 0;   // missing lead id or unusable phone
    };

    Result enqueue(const OrgId& org_id, const std::vector<LeadRef>& leads,
                   int priority, const std::string& added_by, EnqueueSummary& out);

    // Up to n queued entries whose cooldown has passed, now in `dialing`.
    virtual Result next_batch(const OrgId& org_id, size_t n,
                              std::vector<QueueEntry>& out) = 0;

    // Applies a dial outcome. No-op (kOk) unless the entry is in flight, so a
    // replayed webhook cannot consume a second attempt.
    Result mark_outcome(const std::string& entry_id, Disposition disposition,
                        QueueEntry* updated = nullptr);

    // Forward-only progress (dialing -> ringing -> answered).
    virtual Result advance(const std::string& entry_id, QueueStatus to) = 0;

    // Back to queued without consuming an attempt (canceled batch sibling).
    virtual Result requeue(const std::string& entry_id) = 0;

    virtual Result get(const std::string& entry_id, QueueEntry& out) = 0;
    virtual Result list(const OrgId& org_id, std::vector<QueueEntry>& out) = 0;
    virtual Result remove(const OrgId& org_id, const std::string& lead_id) = 0;
    virtual Result clear_queued(const OrgId& org_id, size_t& removed) = 0;

    Result count_by_status(const OrgId& org_id, std::map<std::string, size_t>& out);

    const RetryPolicy& policy() const { return policy_; }

    QueueStore(const QueueStore&) = delete;
    QueueStore& operator=(const QueueStore&) = delete;

protected:
    enum class UpsertKind { kInserted, kRefreshed, kRequeued };

    // Insert `candidate`, or refresh the existing (org_id, lead_id) row:
    // in-flight/queued rows get priority and contact data, terminal rows are
    // reset to queued with attempt_count 0.
    virtual Result upsert_lead(const QueueEntry& candidate, UpsertKind& kind) = 0;

    // Writes `update` only if the row still has observed.status and
    // observed.attempt_count. kConflict when it changed underneath.
    virtual Result apply_outcome_if_unchanged(const QueueEntry& observed,
                                              const OutcomeUpdate& update) = 0;

    RetryPolicy policy_;
};

} // namespace turbo_dialer
#endif // QUEUE_STORE_H

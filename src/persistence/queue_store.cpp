// =============================================================================
// FILE: src/persistence/queue_store.cpp
// =============================================================================
#include "persistence/queue_store.h"
#include "common/ids.h"
#include "common/logger.h"
#include "common/phone_number.h"

namespace turbo_dialer {

static constexpr int kOutcomeCasAttempts = 5;

Result QueueStore::enqueue(const OrgId& org_id, const std::vector<LeadRef>& leads,
                           int priority, const std::string& added_by,
                           EnqueueSummary& out) {
    if (org_id.empty()) return Result::kInvalidArgument;

    EpochMs now = now_epoch_ms();
    Result last_error = Result::kOk;

    for (const auto& lead : leads) {
        std::string phone = normalize_e164(lead.phone);
        if (lead.lead_id.empty() || phone.empty()) {
            LOG_INFO("Queue: org=%s lead=%s rejected, no usable phone ('%s')",
                     org_id.c_str(), lead.lead_id.c_str(), lead.phone.c_str());
            out.rejected++;
            continue;
        }

        QueueEntry candidate;
        candidate.id         = generate_uuid();
        candidate.org_id     = org_id;
        candidate.lead_id    = lead.lead_id;
        candidate.lead_phone = phone;
        candidate.lead_name  = lead.name;
        candidate.priority   = priority;
        candidate.status     = QueueStatus::kQueued;
        candidate.added_at   = now;
        candidate.added_by   = added_by;

        UpsertKind kind = UpsertKind::kInserted;
        Result r = upsert_lead(candidate, kind);
        if (r != Result::kOk) {
            LOG_ERROR("Queue: upsert org=%s lead=%s failed: %s",
                      org_id.c_str(), lead.lead_id.c_str(), result_to_string(r));
            last_error = r;
            continue;
        }
        switch (kind) {
            case UpsertKind::kInserted:  out.inserted++;  break;
            case UpsertKind::kRefreshed: out.refreshed++; break;
            case UpsertKind::kRequeued:  out.requeued++;  break;
        }
    }

    LOG_INFO("Queue: org=%s enqueue inserted=%zu refreshed=%zu requeued=%zu rejected=%zu",
             org_id.c_str(), out.inserted, out.refreshed, out.requeued, out.rejected);
    return last_error;
}

Result QueueStore::mark_outcome(const std::string& entry_id, Disposition disposition,
                                QueueEntry* updated) {
    for (int i = 0; i < kOutcomeCasAttempts; ++i) {
        QueueEntry entry;
        Result r = get(entry_id, entry);
        if (r != Result::kOk) return r;

        if (!is_in_flight(entry.status)) {
            LOG_DEBUG("Queue: outcome %s for entry=%s ignored, status=%s",
                      disposition_to_string(disposition), entry_id.c_str(),
                      queue_status_to_string(entry.status));
            if (updated) *updated = entry;
            return Result::kOk;
        }

        OutcomeUpdate u = compute_outcome(entry, disposition, policy_, now_epoch_ms());
        r = apply_outcome_if_unchanged(entry, u);
        if (r == Result::kConflict) continue;
        if (r != Result::kOk) return r;

        if (u.status == QueueStatus::kFailed) {
            LOG_INFO("Queue: entry=%s lead=%s failed after %d attempts (last=%s)",
                     entry_id.c_str(), entry.lead_id.c_str(), u.attempt_count,
                     u.last_disposition.c_str());
        }
        if (updated) {
            *updated = entry;
            updated->status = u.status;
            updated->attempt_count = u.attempt_count;
            updated->next_attempt_after = u.next_attempt_after;
            updated->last_disposition = u.last_disposition;
        }
        return Result::kOk;
    }

    LOG_WARN("Queue: outcome for entry=%s lost %d races, giving up",
             entry_id.c_str(), kOutcomeCasAttempts);
    return Result::kConflict;
}

Result QueueStore::count_by_status(const OrgId& org_id, std::map<std::string, size_t>& out) {
    std::vector<QueueEntry> entries;
    Result r = list(org_id, entries);
    if (r != Result::kOk) return r;
    for (const auto& e : entries) {
        out[queue_status_to_string(e.status)]++;
    }
    return Result::kOk;
}

} // namespace turbo_dialer

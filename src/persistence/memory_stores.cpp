// =============================================================================
// FILE: src/persistence/memory_stores.cpp
// =============================================================================
#include "persistence/memory_stores.h"
#include <algorithm>
#include <set>

namespace turbo_dialer {

namespace {

std::string lead_key(const OrgId& org_id, const std::string& lead_id) {
    return org_id + "#" + lead_id;
}

int queue_rank(QueueStatus s) {
    switch (s) {
        case QueueStatus::kDialing:  return 1;
        case QueueStatus::kRinging:  return 2;
        case QueueStatus::kAnswered: return 3;
        default:                     return 0;
    }
}

} // namespace

// =============================================================================
// MemoryQueueStore
// =============================================================================

Result MemoryQueueStore::upsert_lead(const QueueEntry& candidate, UpsertKind& kind) {
    std::lock_guard<std::mutex> lk(mu_);
    auto key = lead_key(candidate.org_id, candidate.lead_id);

    auto it = by_lead_.find(key);
    if (it == by_lead_.end()) {
        entries_[candidate.id] = candidate;
        by_lead_[key] = candidate.id;
        kind = UpsertKind::kInserted;
        return Result::kOk;
    }

    QueueEntry& e = entries_[it->second];
    e.priority   = candidate.priority;
    e.lead_phone = candidate.lead_phone;
    if (!candidate.lead_name.empty()) e.lead_name = candidate.lead_name;

    if (is_terminal(e.status)) {
        e.status = QueueStatus::kQueued;
        e.attempt_count = 0;
        e.next_attempt_after = 0;
        e.added_at = candidate.added_at;
        e.added_by = candidate.added_by;
        kind = UpsertKind::kRequeued;
    } else {
        kind = UpsertKind::kRefreshed;
    }
    return Result::kOk;
}

Result MemoryQueueStore::next_batch(const OrgId& org_id, size_t n,
                                    std::vector<QueueEntry>& out) {
    std::lock_guard<std::mutex> lk(mu_);
    EpochMs now = now_epoch_ms();

    std::vector<QueueEntry*> eligible;
    for (auto& [id, e] : entries_) {
        if (e.org_id == org_id && e.status == QueueStatus::kQueued &&
            e.next_attempt_after <= now) {
            eligible.push_back(&e);
        }
    }
    std::sort(eligible.begin(), eligible.end(),
              [](const QueueEntry* a, const QueueEntry* b) { return dials_before(*a, *b); });

    for (size_t i = 0; i < eligible.size() && i < n; ++i) {
        eligible[i]->status = QueueStatus::kDialing;
        eligible[i]->last_attempt_at = now;
        out.push_back(*eligible[i]);
    }
    return Result::kOk;
}

Result MemoryQueueStore::apply_outcome_if_unchanged(const QueueEntry& observed,
                                                    const OutcomeUpdate& u) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = entries_.find(observed.id);
    if (it == entries_.end()) return Result::kNotFound;

    QueueEntry& e = it->second;
    if (e.status != observed.status || e.attempt_count != observed.attempt_count) {
        return Result::kConflict;
    }
    e.status = u.status;
    e.attempt_count = u.attempt_count;
    e.next_attempt_after = u.next_attempt_after;
    e.last_disposition = u.last_disposition;
    return Result::kOk;
}

Result MemoryQueueStore::advance(const std::string& entry_id, QueueStatus to) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = entries_.find(entry_id);
    if (it == entries_.end()) return Result::kNotFound;

    QueueEntry& e = it->second;
    if (!is_in_flight(e.status) || queue_rank(to) <= queue_rank(e.status)) {
        return Result::kConflict;
    }
    e.status = to;
    return Result::kOk;
}

Result MemoryQueueStore::requeue(const std::string& entry_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = entries_.find(entry_id);
    if (it == entries_.end()) return Result::kNotFound;
    if (!is_in_flight(it->second.status)) return Result::kConflict;
    it->second.status = QueueStatus::kQueued;
    it->second.last_disposition = "canceled";
    return Result::kOk;
}

Result MemoryQueueStore::get(const std::string& entry_id, QueueEntry& out) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = entries_.find(entry_id);
    if (it == entries_.end()) return Result::kNotFound;
    out = it->second;
    return Result::kOk;
}

Result MemoryQueueStore::list(const OrgId& org_id, std::vector<QueueEntry>& out) {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, e] : entries_) {
        if (e.org_id == org_id) out.push_back(e);
    }
    std::sort(out.begin(), out.end(), dials_before);
    return Result::kOk;
}

Result MemoryQueueStore::remove(const OrgId& org_id, const std::string& lead_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_lead_.find(lead_key(org_id, lead_id));
    if (it == by_lead_.end()) return Result::kNotFound;
    entries_.erase(it->second);
    by_lead_.erase(it);
    return Result::kOk;
}

Result MemoryQueueStore::clear_queued(const OrgId& org_id, size_t& removed) {
    std::lock_guard<std::mutex> lk(mu_);
    removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.org_id == org_id && it->second.status == QueueStatus::kQueued) {
            by_lead_.erase(lead_key(org_id, it->second.lead_id));
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return Result::kOk;
}

// =============================================================================
// MemoryRepPool
// =============================================================================

Result MemoryRepPool::insert_session(const RepSession& session) {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, s] : sessions_) {
        if (s.org_id == session.org_id && s.rep_id == session.rep_id) {
            return Result::kAlreadyExists;
        }
    }
    sessions_[session.session_id] = session;
    return Result::kOk;
}

Result MemoryRepPool::list_available(const OrgId& org_id, std::vector<RepSession>& out) {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, s] : sessions_) {
        if (s.org_id == org_id && s.availability == RepAvailability::kAvailable) {
            out.push_back(s);
        }
    }
    std::sort(out.begin(), out.end(), [](const RepSession& a, const RepSession& b) {
        if (a.last_released_at != b.last_released_at) return a.last_released_at < b.last_released_at;
        return a.started_at < b.started_at;
    });
    return Result::kOk;
}

Result MemoryRepPool::try_claim(const std::string& session_id, const std::string& call_handle,
                                const std::string& conference_name, EpochMs now) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second.availability != RepAvailability::kAvailable) {
        return Result::kConflict;
    }
    RepSession& s = it->second;
    s.availability = RepAvailability::kClaimed;
    s.conference_name = conference_name;
    s.claimed_call_handle = call_handle;
    s.claimed_at = now;
    return Result::kOk;
}

Result MemoryRepPool::release_rep(const std::string& session_id,
                                  const std::string& expected_conference) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return Result::kNotFound;

    RepSession& s = it->second;
    if (s.availability != RepAvailability::kClaimed) return Result::kNotFound;
    if (!expected_conference.empty() && s.conference_name != expected_conference) {
        return Result::kNotFound;
    }
    s.availability = RepAvailability::kAvailable;
    s.conference_name.clear();
    s.claimed_call_handle.clear();
    s.claimed_at = 0;
    s.last_released_at = now_epoch_ms();
    return Result::kOk;
}

Result MemoryRepPool::increment_connected(const std::string& session_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return Result::kNotFound;
    it->second.connected_call_count++;
    return Result::kOk;
}

Result MemoryRepPool::increment_dialed(const std::string& session_id, uint64_t n) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return Result::kNotFound;
    it->second.calls_dialed += n;
    return Result::kOk;
}

Result MemoryRepPool::close_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.erase(session_id) > 0 ? Result::kOk : Result::kNotFound;
}

Result MemoryRepPool::get(const std::string& session_id, RepSession& out) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return Result::kNotFound;
    out = it->second;
    return Result::kOk;
}

Result MemoryRepPool::find_by_rep(const OrgId& org_id, const std::string& rep_id,
                                  RepSession& out) {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, s] : sessions_) {
        if (s.org_id == org_id && s.rep_id == rep_id) {
            out = s;
            return Result::kOk;
        }
    }
    return Result::kNotFound;
}

Result MemoryRepPool::list_by_org(const OrgId& org_id, std::vector<RepSession>& out) {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, s] : sessions_) {
        if (s.org_id == org_id) out.push_back(s);
    }
    return Result::kOk;
}

Result MemoryRepPool::count_available(const OrgId& org_id, size_t& out) {
    std::lock_guard<std::mutex> lk(mu_);
    out = static_cast<size_t>(std::count_if(sessions_.begin(), sessions_.end(),
        [&](const auto& kv) {
            return kv.second.org_id == org_id &&
                   kv.second.availability == RepAvailability::kAvailable;
        }));
    return Result::kOk;
}

Result MemoryRepPool::active_orgs(std::vector<OrgId>& out) {
    std::lock_guard<std::mutex> lk(mu_);
    std::set<OrgId> orgs;
    for (const auto& [id, s] : sessions_) {
        if (s.availability == RepAvailability::kAvailable) orgs.insert(s.org_id);
    }
    out.assign(orgs.begin(), orgs.end());
    return Result::kOk;
}

Result MemoryRepPool::list_stale_claims(EpochMs claimed_before, std::vector<RepSession>& out) {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, s] : sessions_) {
        if (s.availability == RepAvailability::kClaimed && s.claimed_at < claimed_before) {
            out.push_back(s);
        }
    }
    return Result::kOk;
}

// =============================================================================
// MemoryCallAttemptStore
// =============================================================================

Result MemoryCallAttemptStore::create(const CallAttempt& attempt) {
    std::lock_guard<std::mutex> lk(mu_);
    if (attempts_.count(attempt.call_handle)) return Result::kAlreadyExists;
    attempts_[attempt.call_handle] = attempt;
    return Result::kOk;
}

Result MemoryCallAttemptStore::get(const std::string& call_handle, CallAttempt& out) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = attempts_.find(call_handle);
    if (it == attempts_.end()) return Result::kNotFound;
    out = it->second;
    return Result::kOk;
}

Result MemoryCallAttemptStore::transition(const std::string& call_handle,
                                          const CallUpdate& update,
                                          const std::vector<CallStatus>& only_from,
                                          CallAttempt* before) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = attempts_.find(call_handle);
    if (it == attempts_.end()) return Result::kNotFound;

    auto allowed = allowed_predecessors(update.status, only_from);
    if (std::find(allowed.begin(), allowed.end(), it->second.status) == allowed.end()) {
        return Result::kConflict;
    }
    if (before) *before = it->second;
    apply_call_update(it->second, update);
    return Result::kOk;
}

Result MemoryCallAttemptStore::list_batch(const std::string& batch_id,
                                          std::vector<CallAttempt>& out) {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [handle, a] : attempts_) {
        if (a.batch_id == batch_id) out.push_back(a);
    }
    return Result::kOk;
}

Result MemoryCallAttemptStore::list_active(const OrgId& org_id, std::vector<CallAttempt>& out) {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [handle, a] : attempts_) {
        if (a.org_id == org_id && !is_terminal(a.status)) out.push_back(a);
    }
    return Result::kOk;
}

Result MemoryCallAttemptStore::attach_voicemail(const std::string& call_handle,
                                                const std::string& voicemail_url,
                                                const std::string& transcription) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = attempts_.find(call_handle);
    if (it == attempts_.end()) return Result::kNotFound;
    if (!voicemail_url.empty()) it->second.voicemail_url = voicemail_url;
    if (!transcription.empty()) it->second.voicemail_transcription = transcription;
    return Result::kOk;
}

Result MemoryCallAttemptStore::claim_first_answer(const std::string& batch_id,
                                                  const std::string& call_handle, bool& won) {
    std::lock_guard<std::mutex> lk(mu_);
    auto [it, inserted] = first_answer_.emplace(batch_id, call_handle);
    won = inserted || it->second == call_handle;
    return Result::kOk;
}

} // namespace turbo_dialer

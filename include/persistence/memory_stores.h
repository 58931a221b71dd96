// =============================================================================
// FILE: include/persistence/memory_stores.h
// =============================================================================
#ifndef MEMORY_STORES_H
#define MEMORY_STORES_H

#include "persistence/queue_store.h"
#include "persistence/rep_pool.h"
#include "persistence/call_attempt_store.h"
#include <mutex>
#include <unordered_map>

namespace turbo_dialer {

// In-process backends with the same conditional-write semantics as the
// MongoDB ones: each primitive runs under one mutex, which stands in for
// MongoDB's single-document atomicity. Used by the tests and when
// mongodb.enable_persistence = false (single instance, nothing survives a
// restart).

class MemoryQueueStore final : public QueueStore {
public:
    explicit MemoryQueueStore(const RetryPolicy& policy) : QueueStore(policy) {}

    Result next_batch(const OrgId& org_id, size_t n, std::vector<QueueEntry>& out) override;
    Result advance(const std::string& entry_id, QueueStatus to) override;
    Result requeue(const std::string& entry_id) override;
    Result get(const std::string& entry_id, QueueEntry& out) override;
    Result list(const OrgId& org_id, std::vector<QueueEntry>& out) override;
    Result remove(const OrgId& org_id, const std::string& lead_id) override;
    Result clear_queued(const OrgId& org_id, size_t& removed) override;

protected:
    Result upsert_lead(const QueueEntry& candidate, UpsertKind& kind) override;
    Result apply_outcome_if_unchanged(const QueueEntry& observed,
                                      const OutcomeUpdate& update) override;

private:
    std::mutex mu_;
    std::unordered_map<std::string, QueueEntry> entries_;       // id -> entry
    std::unordered_map<std::string, std::string> by_lead_;      // org#lead -> id
};

class MemoryRepPool final : public RepPool {
public:
    MemoryRepPool() = default;

    Result release_rep(const std::string& session_id,
                       const std::string& expected_conference = "") override;
    Result increment_connected(const std::string& session_id) override;
    Result increment_dialed(const std::string& session_id, uint64_t n) override;
    Result close_session(const std::string& session_id) override;
    Result get(const std::string& session_id, RepSession& out) override;
    Result find_by_rep(const OrgId& org_id, const std::string& rep_id, RepSession& out) override;
    Result list_by_org(const OrgId& org_id, std::vector<RepSession>& out) override;
    Result count_available(const OrgId& org_id, size_t& out) override;
    Result active_orgs(std::vector<OrgId>& out) override;
    Result list_stale_claims(EpochMs claimed_before, std::vector<RepSession>& out) override;

protected:
    Result list_available(const OrgId& org_id, std::vector<RepSession>& out) override;
    Result try_claim(const std::string& session_id, const std::string& call_handle,
                     const std::string& conference_name, EpochMs now) override;
    Result insert_session(const RepSession& session) override;

private:
    std::mutex mu_;
    std::unordered_map<std::string, RepSession> sessions_;
};

class MemoryCallAttemptStore final : public CallAttemptStore {
public:
    MemoryCallAttemptStore() = default;

    Result create(const CallAttempt& attempt) override;
    Result get(const std::string& call_handle, CallAttempt& out) override;
    Result transition(const std::string& call_handle, const CallUpdate& update,
                      const std::vector<CallStatus>& only_from = {},
                      CallAttempt* before = nullptr) override;
    Result list_batch(const std::string& batch_id, std::vector<CallAttempt>& out) override;
    Result list_active(const OrgId& org_id, std::vector<CallAttempt>& out) override;
    Result attach_voicemail(const std::string& call_handle,
                            const std::string& voicemail_url,
                            const std::string& transcription) override;
    Result claim_first_answer(const std::string& batch_id,
                              const std::string& call_handle, bool& won) override;

private:
    std::mutex mu_;
    std::unordered_map<std::string, CallAttempt> attempts_;
    std::unordered_map<std::string, std::string> first_answer_;  // batch -> handle
};

} // namespace turbo_dialer
#endif // MEMORY_STORES_H

// =============================================================================
// FILE: include/persistence/mongo_stores.h
// =============================================================================
#ifndef MONGO_STORES_H
#define MONGO_STORES_H

#include "common/config.h"
#include "persistence/queue_store.h"
#include "persistence/rep_pool.h"
#include "persistence/call_attempt_store.h"
#include <memory>

namespace turbo_dialer {

class MongoClient;

// MongoDB backends. Every conditional write is a single-document
// update_one / find_one_and_update whose filter carries the guard, so the
// server decides races, not this process. Multiple service instances can
// share one database.

class MongoQueueStore final : public QueueStore {
public:
    MongoQueueStore(const Config& config, std::shared_ptr<MongoClient> mongo);

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
    std::shared_ptr<MongoClient> mongo_;
    std::string collection_;
};

class MongoRepPool final : public RepPool {
public:
    MongoRepPool(const Config& config, std::shared_ptr<MongoClient> mongo);

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
    Result bump_counter(const std::string& session_id, const char* field, int64_t n);

    std::shared_ptr<MongoClient> mongo_;
    std::string collection_;
};

class MongoCallAttemptStore final : public CallAttemptStore {
public:
    MongoCallAttemptStore(const Config& config, std::shared_ptr<MongoClient> mongo);

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
    std::shared_ptr<MongoClient> mongo_;
    std::string collection_;
    std::string batches_collection_;
};

} // namespace turbo_dialer
#endif // MONGO_STORES_H

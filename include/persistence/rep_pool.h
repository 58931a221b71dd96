// =============================================================================
// FILE: include/persistence/rep_pool.h
// =============================================================================
#ifndef REP_POOL_H
#define REP_POOL_H

#include "common/types.h"
#include "model/rep_session.h"
#include <string>
#include <vector>

namespace turbo_dialer {

// Durable pool of reps logged into the dialer and their claim state.
//
// Availability is never cached in process memory. claim_available_rep walks
// the available sessions longest-idle first and tries a compare-and-set on
// each ("update where session_id=X and availability=available"); the first
// write that lands wins. Concurrent claimers that lose on a row move on to the
// next, so N racers against a pool of one see exactly one success.
class RepPool {
public:
    RepPool() = default;
    virtual ~RepPool() = default;

    // kNotAvailable when no session could be claimed. Never blocks.
    Result claim_available_rep(const OrgId& org_id, const std::string& call_handle,
                               RepClaim& out);

    // Frees the claim. A non-empty expected_conference restricts the release
    // to that claim, so a late event from an earlier call cannot free a newer
    // one. kNotFound when there is nothing to release (already released,
    // session gone); callers treat that as success.
    virtual Result release_rep(const std::string& session_id,
                               const std::string& expected_conference = "") = 0;

    // Best effort: kNotFound if the session ended meanwhile.
    virtual Result increment_connected(const std::string& session_id) = 0;
    virtual Result increment_dialed(const std::string& session_id, uint64_t n) = 0;

    // Idempotent per (org, rep): returns the existing session if one is open.
    Result open_session(const OrgId& org_id, const std::string& rep_id, RepSession& out);
    virtual Result close_session(const std::string& session_id) = 0;

    virtual Result get(const std::string& session_id, RepSession& out) = 0;
    virtual Result find_by_rep(const OrgId& org_id, const std::string& rep_id,
                               RepSession& out) = 0;
    virtual Result list_by_org(const OrgId& org_id, std::vector<RepSession>& out) = 0;
    virtual Result count_available(const OrgId& org_id, size_t& out) = 0;

    // Orgs with at least one available session.
    virtual Result active_orgs(std::vector<OrgId>& out) = 0;

    // Claimed sessions with claimed_at < claimed_before.
    virtual Result list_stale_claims(EpochMs claimed_before, std::vector<RepSession>& out) = 0;

    RepPool(const RepPool&) = delete;
    RepPool& operator=(const RepPool&) = delete;

protected:
    // Available sessions of the org, never-released first, then by
    // last_released_at ascending.
    virtual Result list_available(const OrgId& org_id, std::vector<RepSession>& out) = 0;

    // Single conditional write: available -> claimed. kConflict if the
    // session is no longer available.
    virtual Result try_claim(const std::string& session_id, const std::string& call_handle,
                             const std::string& conference_name, EpochMs now) = 0;

    virtual Result insert_session(const RepSession& session) = 0;
};

} // namespace turbo_dialer
#endif // REP_POOL_H

// =============================================================================
// FILE: src/persistence/rep_pool.cpp
// =============================================================================
#include "persistence/rep_pool.h"
#include "common/ids.h"
#include "common/logger.h"

namespace turbo_dialer {

Result RepPool::claim_available_rep(const OrgId& org_id, const std::string& call_handle,
                                    RepClaim& out) {
    std::vector<RepSession> candidates;
    Result r = list_available(org_id, candidates);
    if (r != Result::kOk) return r;

    for (const auto& s : candidates) {
        EpochMs now = now_epoch_ms();
        std::string conference = make_conference_name(org_id, s.rep_id, now);

        r = try_claim(s.session_id, call_handle, conference, now);
        if (r == Result::kConflict) continue;   // another answer got this rep first
        if (r != Result::kOk) return r;

        out.session_id = s.session_id;
        out.rep_id = s.rep_id;
        out.conference_name = conference;
        LOG_INFO("RepPool: org=%s rep=%s claimed by call=%s conference=%s",
                 org_id.c_str(), s.rep_id.c_str(), call_handle.c_str(), conference.c_str());
        return Result::kOk;
    }

    return Result::kNotAvailable;
}

Result RepPool::open_session(const OrgId& org_id, const std::string& rep_id, RepSession& out) {
    if (org_id.empty() || rep_id.empty()) return Result::kInvalidArgument;

    Result r = find_by_rep(org_id, rep_id, out);
    if (r == Result::kOk) return Result::kOk;
    if (r != Result::kNotFound) return r;

    RepSession s;
    s.session_id = generate_uuid();
    s.org_id = org_id;
    s.rep_id = rep_id;
    s.started_at = now_epoch_ms();

    r = insert_session(s);
    if (r == Result::kAlreadyExists) {
        // Lost a race with a concurrent start for the same rep
        return find_by_rep(org_id, rep_id, out);
    }
    if (r != Result::kOk) return r;

    LOG_INFO("RepPool: session %s opened for org=%s rep=%s",
             s.session_id.c_str(), org_id.c_str(), rep_id.c_str());
    out = s;
    return Result::kOk;
}

} // namespace turbo_dialer

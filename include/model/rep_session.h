// =============================================================================
// FILE: include/model/rep_session.h
// =============================================================================
#ifndef MODEL_REP_SESSION_H
#define MODEL_REP_SESSION_H

#include "common/types.h"
#include <string>

namespace turbo_dialer {

enum class RepAvailability { kAvailable, kClaimed };

inline const char* availability_to_string(RepAvailability a) {
    return a == RepAvailability::kClaimed ? "claimed" : "available";
}

inline RepAvailability availability_from_string(const std::string& s) {
    return s == "claimed" ? RepAvailability::kClaimed : RepAvailability::kAvailable;
}

// One rep logged into the dialing pool.
// Invariant: conference_name and claimed_call_handle are non-empty iff claimed.
struct RepSession {
    std::string     session_id;
    std::string     rep_id;
    OrgId           org_id;
    RepAvailability availability        = RepAvailability::kAvailable;
    std::string     conference_name;
    std::string     claimed_call_handle;
    EpochMs         claimed_at           = 0;
    EpochMs         started_at           = 0;
    EpochMs         last_released_at     = 0;   // 0 = never claimed, first in line
    uint64_t        calls_dialed         = 0;
    uint64_t        connected_call_count = 0;
};

// What a successful ClaimAvailableRep hands back.
struct RepClaim {
    std::string session_id;
    std::string rep_id;
    std::string conference_name;
};

} // namespace turbo_dialer
#endif // MODEL_REP_SESSION_H

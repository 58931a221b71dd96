// =============================================================================
// FILE: include/common/ids.h
// =============================================================================
#ifndef COMMON_IDS_H
#define COMMON_IDS_H

#include "common/types.h"
#include <string>

namespace turbo_dialer {

// Random RFC 4122 version 4 identifier, lower-case hex with dashes.
std::string generate_uuid();

// "turbo-<org>-<rep>-<epoch_ms>". Unique per claim without a coordination
// round-trip: one rep cannot be claimed twice in the same millisecond.
std::string make_conference_name(const OrgId& org_id, const std::string& rep_id,
                                 EpochMs at);

} // namespace turbo_dialer
#endif // COMMON_IDS_H

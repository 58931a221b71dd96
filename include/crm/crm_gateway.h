// =============================================================================
// FILE: include/crm/crm_gateway.h
// =============================================================================
#ifndef CRM_GATEWAY_H
#define CRM_GATEWAY_H

#include "common/types.h"
#include "model/call_attempt.h"
#include <string>

namespace turbo_dialer {

// Side effects in the CRM that follow a dial. The dialer never waits on the
// CRM for a decision: callers log a non-kOk result and continue.
class CrmGateway {
public:
    virtual ~CrmGateway() = default;

    // Lead now belongs to the rep who took the call.
    virtual Result assign_lead_owner(const OrgId& org_id, const std::string& lead_id,
                                     const std::string& rep_id) = 0;

    // Call-log row for a bridged call.
    virtual Result create_call_record(const CallAttempt& attempt) = 0;

    // Post-terminal hook: final status, duration, recording.
    virtual Result complete_call_record(const CallAttempt& attempt) = 0;
};

} // namespace turbo_dialer
#endif // CRM_GATEWAY_H

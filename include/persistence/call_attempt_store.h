// =============================================================================
// FILE: include/persistence/call_attempt_store.h
// =============================================================================
#ifndef CALL_ATTEMPT_STORE_H
#define CALL_ATTEMPT_STORE_H

#include "common/types.h"
#include "model/call_attempt.h"
#include <string>
#include <vector>

namespace turbo_dialer {

// Durable record of individual dials keyed by the provider call handle, plus
// the per-batch first-answer marker.
class CallAttemptStore {
public:
    CallAttemptStore() = default;
    virtual ~CallAttemptStore() = default;

    // kAlreadyExists if the handle is already recorded.
    virtual Result create(const CallAttempt& attempt) = 0;

    virtual Result get(const std::string& call_handle, CallAttempt& out) = 0;

    // Conditional status write. Lands only if can_transition(current,
    // update.status) holds and, when only_from is non-empty, the current
    // status is one of only_from. On success `before` (if given) receives the
    // row as it was. kConflict when the guard rejected the write, kNotFound
    // for an unknown handle.
    virtual Result transition(const std::string& call_handle, const CallUpdate& update,
                              const std::vector<CallStatus>& only_from = {},
                              CallAttempt* before = nullptr) = 0;

    virtual Result list_batch(const std::string& batch_id, std::vector<CallAttempt>& out) = 0;

    // Non-terminal attempts of an org.
    virtual Result list_active(const OrgId& org_id, std::vector<CallAttempt>& out) = 0;

    // Empty arguments leave the stored value alone.
    virtual Result attach_voicemail(const std::string& call_handle,
                                    const std::string& voicemail_url,
                                    const std::string& transcription) = 0;

    // Records call_handle as the batch's first human answer unless another
    // handle already holds it. `won` tells which happened.
    virtual Result claim_first_answer(const std::string& batch_id,
                                      const std::string& call_handle, bool& won) = 0;

    CallAttemptStore(const CallAttemptStore&) = delete;
    CallAttemptStore& operator=(const CallAttemptStore&) = delete;
};

// Statuses from which `to` may be reached under the forward-only rule.
std::vector<CallStatus> allowed_predecessors(CallStatus to,
                                             const std::vector<CallStatus>& only_from = {});

} // namespace turbo_dialer
#endif // CALL_ATTEMPT_STORE_H

// =============================================================================
// FILE: src/persistence/call_attempt_store.cpp
// =============================================================================
#include "persistence/call_attempt_store.h"
#include <algorithm>

namespace turbo_dialer {

static const CallStatus kAllStatuses[] = {
    CallStatus::kDialing, CallStatus::kRinging, CallStatus::kAnswered,
    CallStatus::kHolding, CallStatus::kConnected, CallStatus::kVoicemail,
    CallStatus::kMachine, CallStatus::kCompleted, CallStatus::kBusy,
    CallStatus::kNoAnswer, CallStatus::kFailed, CallStatus::kCanceled
};

std::vector<CallStatus> allowed_predecessors(CallStatus to,
                                             const std::vector<CallStatus>& only_from) {
    std::vector<CallStatus> out;
    for (CallStatus from : kAllStatuses) {
        if (!can_transition(from, to)) continue;
        if (!only_from.empty() &&
            std::find(only_from.begin(), only_from.end(), from) == only_from.end()) {
            continue;
        }
        out.push_back(from);
    }
    return out;
}

} // namespace turbo_dialer

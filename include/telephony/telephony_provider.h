// =============================================================================
// FILE: include/telephony/telephony_provider.h
// =============================================================================
#ifndef TELEPHONY_PROVIDER_H
#define TELEPHONY_PROVIDER_H

#include "common/types.h"
#include <string>

namespace turbo_dialer {

struct PlaceCallRequest {
    std::string to;                    // E.164, or "client:<name>" for a rep leg
    std::string from;                  // caller id, E.164
    std::string answer_url;            // fetched when the callee picks up
    std::string status_callback_url;   // call lifecycle events
    Seconds     ring_timeout                = Seconds(30);
    bool        detect_machine              = true;   // off for rep legs
    Seconds     machine_detection_timeout   = Seconds(5);
};

// Outbound side of the voice provider. Implementations must be safe to call
// from several webhook threads at once.
class TelephonyProvider {
public:
    virtual ~TelephonyProvider() = default;

    // kOk with the provider's call handle, kProviderError when the provider
    // refused or could not be reached.
    virtual Result place_call(const PlaceCallRequest& request, std::string& call_handle) = 0;

    // Stops a call that has not been answered yet. A call that already
    // ended reports kProviderError; callers log and move on.
    virtual Result cancel_call(const std::string& call_handle) = 0;
};

} // namespace turbo_dialer
#endif // TELEPHONY_PROVIDER_H

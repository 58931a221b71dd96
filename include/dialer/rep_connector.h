// =============================================================================
// FILE: include/dialer/rep_connector.h
// =============================================================================
#ifndef REP_CONNECTOR_H
#define REP_CONNECTOR_H

#include "common/config.h"
#include "common/types.h"
#include "dialer/callback_urls.h"
#include "model/rep_session.h"
#include "telephony/voice_response.h"
#include <atomic>
#include <string>

namespace turbo_dialer {

class RepPool;
class TelephonyProvider;

// Brings the rep's own leg into the conference a claim created.
//
// When a lead is bridged, ring_rep() dials telephony.rep_endpoint with an
// answer URL naming the claim's conference. The rep leg starts the
// conference on entry and ends it on exit, so the lead (who neither starts
// nor ends it) is dropped when the rep hangs up. The rep leg's terminal
// status frees the claim it was dialed for, whether the rep talked or never
// picked up.
class RepConnector {
public:
    struct Dependencies {
        RepPool*           reps     = nullptr;
        TelephonyProvider* provider = nullptr;
    };

    RepConnector(const Config& config, const Dependencies& deps);

    Result ring_rep(const RepClaim& claim, const std::string& caller_id,
                    std::string& leg_handle);

    // Document for a rep leg. With a conference name only that claim is
    // joined; without one (a softphone connecting through join_url) the
    // session's current claim is. No matching claim: short notice, hang up.
    VoiceResponse join_document(const std::string& session_id,
                                const std::string& conference_name);

    // Rep leg status callback. kOk when the claim was released, kNotFound
    // when there was nothing left to release, kInvalidArgument without a
    // conference name.
    Result handle_leg_status(const std::string& session_id,
                             const std::string& conference_name,
                             const std::string& provider_status);

    // Returned from session start for softphones that dial in themselves.
    std::string join_url(const std::string& session_id) const {
        return urls_.session_join(session_id);
    }

    std::string endpoint_for(const std::string& rep_id) const;

    struct Stats {
        std::atomic<uint64_t> legs_dialed{0};
        std::atomic<uint64_t> legs_failed{0};
        std::atomic<uint64_t> joins_served{0};
        std::atomic<uint64_t> joins_refused{0};
        std::atomic<uint64_t> legs_ended{0};
        std::atomic<uint64_t> claims_released{0};
    };
    const Stats& stats() const { return stats_; }

    RepConnector(const RepConnector&) = delete;
    RepConnector& operator=(const RepConnector&) = delete;

private:
    std::string endpoint_template_;
    Seconds ring_timeout_;
    CallbackUrls urls_;
    Dependencies deps_;
    Stats stats_;
};

} // namespace turbo_dialer
#endif // REP_CONNECTOR_H

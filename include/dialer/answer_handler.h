// =============================================================================
// FILE: include/dialer/answer_handler.h
// =============================================================================
#ifndef ANSWER_HANDLER_H
#define ANSWER_HANDLER_H

#include "common/config.h"
#include "common/types.h"
#include "dialer/callback_urls.h"
#include "model/call_attempt.h"
#include "model/rep_session.h"
#include "telephony/voice_response.h"
#include <atomic>
#include <string>

namespace turbo_dialer {

class QueueStore;
class RepPool;
class CallAttemptStore;
class TelephonyProvider;
class CrmGateway;
class RepConnector;

// Decides what happens to a lead that just picked up.
//
//   machine / fax          -> attempt `machine`, hang up, entry completed
//   rep claimed            -> dial the rep's leg, bridge the lead into the
//                             claim's conference, cancel the batch siblings
//                             still ringing, CRM side effects
//   rep leg not placed     -> claim released, treated like no rep
//   no rep, first time     -> `holding`: short prompt, pause, redirect back here
//   no rep, second time    -> `voicemail`: record with transcription, entry completed
//
// Keeps no per-call state: a redirect after the hold and a duplicate delivery
// are both recognised from the stored attempt.
class AnswerHandler {
public:
    struct Dependencies {
        QueueStore*        queue    = nullptr;
        RepPool*           reps     = nullptr;
        CallAttemptStore*  calls    = nullptr;
        TelephonyProvider* provider = nullptr;
        CrmGateway*        crm      = nullptr;
        RepConnector*      connector = nullptr;
    };

    AnswerHandler(const Config& config, const Dependencies& deps);

    VoiceResponse handle_answer(const std::string& call_handle, const std::string& answered_by);

    struct Stats {
        std::atomic<uint64_t> answers{0};
        std::atomic<uint64_t> untracked{0};
        std::atomic<uint64_t> duplicates{0};
        std::atomic<uint64_t> machines{0};
        std::atomic<uint64_t> connected{0};
        std::atomic<uint64_t> holds{0};
        std::atomic<uint64_t> voicemails{0};
        std::atomic<uint64_t> races_lost{0};
        std::atomic<uint64_t> rep_legs_failed{0};
        std::atomic<uint64_t> siblings_canceled{0};
    };
    const Stats& stats() const { return stats_; }

    AnswerHandler(const AnswerHandler&) = delete;
    AnswerHandler& operator=(const AnswerHandler&) = delete;

private:
    VoiceResponse handle_machine(const CallAttempt& call);
    VoiceResponse connect(const CallAttempt& call, const RepClaim& claim);
    VoiceResponse hold_or_voicemail(const CallAttempt& call);

    // Same document the stored state was produced with; used for duplicate
    // deliveries and after losing a conditional write.
    VoiceResponse reissue(const CallAttempt& call);
    VoiceResponse reissue_current(const std::string& call_handle);

    void release_claim(const RepClaim& claim);
    void cancel_siblings(const CallAttempt& winner);
    void notify_crm(const CallAttempt& connected);
    void mark_entry(const CallAttempt& call, Disposition disposition);

    VoiceResponse bridge_document(const std::string& conference_name,
                                  const std::string& session_id) const;
    VoiceResponse hold_document() const;
    VoiceResponse voicemail_document(const std::string& call_handle) const;
    static VoiceResponse apology_document();

    Seconds hold_pause_;
    Seconds voicemail_max_length_;
    CallbackUrls urls_;
    Dependencies deps_;
    Stats stats_;
};

} // namespace turbo_dialer
#endif // ANSWER_HANDLER_H

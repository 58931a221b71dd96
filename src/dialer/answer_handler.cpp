// =============================================================================
// FILE: src/dialer/answer_handler.cpp
// =============================================================================
#include "dialer/answer_handler.h"
#include "persistence/queue_store.h"
#include "persistence/rep_pool.h"
#include "persistence/call_attempt_store.h"
#include "telephony/telephony_provider.h"
#include "dialer/rep_connector.h"
#include "crm/crm_gateway.h"
#include "common/logger.h"

#include <vector>

namespace turbo_dialer {

namespace {

const char* kHoldPrompt      = "One moment please.";
const char* kVoicemailPrompt = "Hi, thanks for answering! All of our representatives are "
                               "currently busy. Please leave a message after the beep.";
const char* kApology         = "We are experiencing technical difficulties. "
                               "Please try again later.";

} // namespace

AnswerHandler::AnswerHandler(const Config& config, const Dependencies& deps)
    : hold_pause_(config.hold_pause)
    , voicemail_max_length_(config.voicemail_max_length)
    , urls_(config.public_base_url)
    , deps_(deps)
{}

VoiceResponse AnswerHandler::handle_answer(const std::string& call_handle,
                                           const std::string& answered_by) {
    stats_.answers.fetch_add(1, std::memory_order_relaxed);

    CallAttempt call;
    Result r = deps_.calls->get(call_handle, call);
    if (r == Result::kNotFound) {
        stats_.untracked.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Answer: call=%s not tracked, hanging up", call_handle.c_str());
        VoiceResponse vr;
        vr.hangup();
        return vr;
    }
    if (r != Result::kOk) {
        LOG_ERROR("Answer: call=%s lookup failed: %s", call_handle.c_str(), result_to_string(r));
        return apology_document();
    }

    if (call.status == CallStatus::kConnected || call.status == CallStatus::kVoicemail ||
        is_terminal(call.status)) {
        stats_.duplicates.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG("Answer: call=%s already %s, re-issuing", call_handle.c_str(),
                  call_status_to_string(call.status));
        return reissue(call);
    }

    // The redirect after a hold comes back here; detection already ran then
    if (call.status != CallStatus::kHolding && is_machine(parse_answered_by(answered_by))) {
        LOG_INFO("Answer: call=%s answered by %s, no rep claimed",
                 call_handle.c_str(), answered_by.c_str());
        return handle_machine(call);
    }

    RepClaim claim;
    r = deps_.reps->claim_available_rep(call.org_id, call_handle, claim);
    if (r == Result::kOk) return connect(call, claim);

    if (r != Result::kNotAvailable) {
        LOG_ERROR("Answer: call=%s claim failed: %s", call_handle.c_str(), result_to_string(r));
    } else {
        LOG_INFO("Answer: call=%s org=%s no rep available (failures so far %d)",
                 call_handle.c_str(), call.org_id.c_str(), call.claim_failures);
    }
    return hold_or_voicemail(call);
}

VoiceResponse AnswerHandler::handle_machine(const CallAttempt& call) {
    CallUpdate u{CallStatus::kMachine};
    u.ended_at = now_epoch_ms();

    Result r = deps_.calls->transition(call.call_handle, u);
    if (r == Result::kOk) {
        stats_.machines.fetch_add(1, std::memory_order_relaxed);
        mark_entry(call, Disposition::kMachine);
    } else if (r != Result::kConflict) {
        LOG_ERROR("Answer: call=%s machine transition failed: %s",
                  call.call_handle.c_str(), result_to_string(r));
    }

    VoiceResponse vr;
    vr.hangup();
    return vr;
}

VoiceResponse AnswerHandler::connect(const CallAttempt& call, const RepClaim& claim) {
    std::string rep_leg;
    Result r = deps_.connector->ring_rep(claim, call.caller_id, rep_leg);
    if (r != Result::kOk) {
        stats_.rep_legs_failed.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Answer: call=%s rep=%s could not be rung, giving the claim back",
                 call.call_handle.c_str(), claim.rep_id.c_str());
        release_claim(claim);
        return hold_or_voicemail(call);
    }

    bool first = false;
    r = deps_.calls->claim_first_answer(call.batch_id, call.call_handle, first);
    if (r != Result::kOk) {
        LOG_WARN("Answer: batch=%s first-answer marker not written: %s",
                 call.batch_id.c_str(), result_to_string(r));
        first = false;
    }

    CallUpdate u{CallStatus::kConnected};
    u.connected_at    = now_epoch_ms();
    u.assigned_rep_id = claim.rep_id;
    u.session_id      = claim.session_id;
    u.conference_name = claim.conference_name;
    u.is_first_answer = first;

    CallAttempt before;
    r = deps_.calls->transition(call.call_handle, u, {}, &before);
    if (r != Result::kOk) {
        // The lead hung up meanwhile, or a duplicate delivery connected first
        stats_.races_lost.fetch_add(1, std::memory_order_relaxed);
        LOG_INFO("Answer: call=%s could not connect (%s), releasing rep=%s",
                 call.call_handle.c_str(), result_to_string(r), claim.rep_id.c_str());
        // The rep leg already ringing finds no claim and is hung up on answer
        release_claim(claim);
        return r == Result::kConflict ? reissue_current(call.call_handle) : apology_document();
    }

    stats_.connected.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO("Answer: call=%s lead=%s bridged to rep=%s leg=%s conference=%s first_answer=%s",
             call.call_handle.c_str(), call.lead_id.c_str(), claim.rep_id.c_str(),
             rep_leg.c_str(), claim.conference_name.c_str(), first ? "true" : "false");

    Result ar = deps_.queue->advance(call.queue_entry_id, QueueStatus::kAnswered);
    if (ar != Result::kOk && ar != Result::kConflict) {
        LOG_WARN("Answer: entry=%s not advanced: %s",
                 call.queue_entry_id.c_str(), result_to_string(ar));
    }

    CallAttempt connected = before;
    apply_call_update(connected, u);

    cancel_siblings(connected);
    notify_crm(connected);

    return bridge_document(claim.conference_name, claim.session_id);
}

VoiceResponse AnswerHandler::hold_or_voicemail(const CallAttempt& call) {
    if (call.status != CallStatus::kHolding && call.claim_failures == 0) {
        CallUpdate u{CallStatus::kHolding};
        u.claim_failures = 1;
        Result r = deps_.calls->transition(call.call_handle, u);
        if (r == Result::kConflict) return reissue_current(call.call_handle);
        if (r != Result::kOk) {
            // Without a stored hold the redirect would hold again; go straight to voicemail
            LOG_ERROR("Answer: call=%s hold transition failed: %s",
                      call.call_handle.c_str(), result_to_string(r));
            return voicemail_document(call.call_handle);
        }
        stats_.holds.fetch_add(1, std::memory_order_relaxed);
        return hold_document();
    }

    // Second miss: never a third try
    CallUpdate u{CallStatus::kVoicemail};
    u.claim_failures = call.claim_failures + 1;
    Result r = deps_.calls->transition(call.call_handle, u, {CallStatus::kHolding});
    if (r == Result::kConflict) return reissue_current(call.call_handle);
    if (r != Result::kOk) {
        LOG_ERROR("Answer: call=%s voicemail transition failed: %s",
                  call.call_handle.c_str(), result_to_string(r));
        return voicemail_document(call.call_handle);
    }

    stats_.voicemails.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO("Answer: call=%s lead=%s sent to voicemail", call.call_handle.c_str(),
             call.lead_id.c_str());
    mark_entry(call, Disposition::kVoicemail);
    return voicemail_document(call.call_handle);
}

void AnswerHandler::release_claim(const RepClaim& claim) {
    Result r = deps_.reps->release_rep(claim.session_id, claim.conference_name);
    if (r != Result::kOk && r != Result::kNotFound) {
        LOG_ERROR("Answer: release of session=%s failed: %s",
                  claim.session_id.c_str(), result_to_string(r));
    }
}

void AnswerHandler::cancel_siblings(const CallAttempt& winner) {
    if (winner.batch_id.empty()) return;

    std::vector<CallAttempt> batch;
    Result r = deps_.calls->list_batch(winner.batch_id, batch);
    if (r != Result::kOk) {
        LOG_WARN("Answer: batch=%s siblings not listed: %s",
                 winner.batch_id.c_str(), result_to_string(r));
        return;
    }

    for (const auto& sibling : batch) {
        if (sibling.call_handle == winner.call_handle || !is_pre_answer(sibling.status)) continue;

        CallUpdate u{CallStatus::kCanceled};
        u.ended_at = now_epoch_ms();
        r = deps_.calls->transition(sibling.call_handle, u,
                                    {CallStatus::kDialing, CallStatus::kRinging});
        if (r != Result::kOk) {
            // Picked up or ended while we looked; its own events settle it
            LOG_DEBUG("Answer: sibling=%s left alone: %s",
                      sibling.call_handle.c_str(), result_to_string(r));
            continue;
        }

        if (deps_.provider->cancel_call(sibling.call_handle) != Result::kOk) {
            LOG_INFO("Answer: provider cancel of sibling=%s not applied",
                     sibling.call_handle.c_str());
        }

        Result qr = deps_.queue->requeue(sibling.queue_entry_id);
        if (qr != Result::kOk) {
            LOG_WARN("Answer: sibling entry=%s not requeued: %s",
                     sibling.queue_entry_id.c_str(), result_to_string(qr));
        }
        stats_.siblings_canceled.fetch_add(1, std::memory_order_relaxed);
    }
}

void AnswerHandler::notify_crm(const CallAttempt& connected) {
    Result r = deps_.crm->assign_lead_owner(connected.org_id, connected.lead_id,
                                            connected.assigned_rep_id);
    if (r != Result::kOk) {
        LOG_WARN("Answer: CRM owner of lead=%s not updated: %s",
                 connected.lead_id.c_str(), result_to_string(r));
    }
    r = deps_.crm->create_call_record(connected);
    if (r != Result::kOk) {
        LOG_WARN("Answer: CRM call record for call=%s not created: %s",
                 connected.call_handle.c_str(), result_to_string(r));
    }
}

void AnswerHandler::mark_entry(const CallAttempt& call, Disposition disposition) {
    Result r = deps_.queue->mark_outcome(call.queue_entry_id, disposition);
    if (r != Result::kOk) {
        LOG_ERROR("Answer: entry=%s outcome %s not recorded: %s",
                  call.queue_entry_id.c_str(), disposition_to_string(disposition),
                  result_to_string(r));
    }
}

VoiceResponse AnswerHandler::reissue(const CallAttempt& call) {
    switch (call.status) {
        case CallStatus::kConnected:
            return bridge_document(call.conference_name, call.session_id);
        case CallStatus::kVoicemail:
            return voicemail_document(call.call_handle);
        case CallStatus::kHolding:
            return hold_document();
        default:
            break;
    }
    VoiceResponse vr;
    vr.hangup();
    return vr;
}

VoiceResponse AnswerHandler::reissue_current(const std::string& call_handle) {
    CallAttempt now;
    Result r = deps_.calls->get(call_handle, now);
    if (r != Result::kOk) {
        LOG_ERROR("Answer: call=%s re-read failed: %s", call_handle.c_str(), result_to_string(r));
        return apology_document();
    }
    return reissue(now);
}

VoiceResponse AnswerHandler::bridge_document(const std::string& conference_name,
                                             const std::string& session_id) const {
    VoiceResponse::ConferenceOptions opts;
    opts.start_on_enter  = false;  // never open a room the rep already left
    opts.end_on_exit     = false;
    opts.beep            = false;
    opts.status_callback = urls_.conference_status(session_id);

    VoiceResponse vr;
    vr.dial_conference(conference_name, opts);
    return vr;
}

VoiceResponse AnswerHandler::hold_document() const {
    VoiceResponse vr;
    vr.say(kHoldPrompt).pause(hold_pause_).redirect(urls_.lead_answered());
    return vr;
}

VoiceResponse AnswerHandler::voicemail_document(const std::string& call_handle) const {
    VoiceResponse::RecordOptions opts;
    opts.max_length          = voicemail_max_length_;
    opts.transcribe          = true;
    opts.play_beep           = true;
    opts.action              = urls_.voicemail(call_handle);
    opts.transcribe_callback = urls_.voicemail_transcription(call_handle);

    VoiceResponse vr;
    vr.say(kVoicemailPrompt).record(opts).say("Goodbye.").hangup();
    return vr;
}

VoiceResponse AnswerHandler::apology_document() {
    VoiceResponse vr;
    vr.say(kApology).hangup();
    return vr;
}

} // namespace turbo_dialer

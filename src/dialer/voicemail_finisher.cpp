// =============================================================================
// FILE: src/dialer/voicemail_finisher.cpp
// =============================================================================
#include "dialer/voicemail_finisher.h"
#include "persistence/queue_store.h"
#include "persistence/call_attempt_store.h"
#include "common/logger.h"

namespace turbo_dialer {

VoicemailFinisher::VoicemailFinisher(const Dependencies& deps) : deps_(deps) {}

VoiceResponse VoicemailFinisher::handle_recording(const std::string& call_handle,
                                                  const std::string& recording_url) {
    VoiceResponse vr;
    vr.say("Thank you. Goodbye.").hangup();

    CallAttempt call;
    Result r = deps_.calls->get(call_handle, call);
    if (r == Result::kNotFound) {
        stats_.untracked.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Voicemail: recording for unknown call=%s", call_handle.c_str());
        return vr;
    }
    if (r != Result::kOk) {
        LOG_ERROR("Voicemail: call=%s lookup failed: %s", call_handle.c_str(), result_to_string(r));
        return vr;
    }

    r = deps_.calls->attach_voicemail(call_handle, recording_url, "");
    if (r != Result::kOk) {
        LOG_ERROR("Voicemail: recording for call=%s not stored: %s",
                  call_handle.c_str(), result_to_string(r));
    } else {
        stats_.recordings.fetch_add(1, std::memory_order_relaxed);
        LOG_INFO("Voicemail: call=%s lead=%s left a message", call_handle.c_str(),
                 call.lead_id.c_str());
    }

    r = mark_completed(call_handle, call.queue_entry_id);
    if (r != Result::kOk) {
        LOG_ERROR("Voicemail: entry=%s not completed: %s",
                  call.queue_entry_id.c_str(), result_to_string(r));
    }
    return vr;
}

Result VoicemailFinisher::handle_transcription(const std::string& call_handle,
                                               const std::string& text,
                                               const std::string& status) {
    CallAttempt call;
    Result r = deps_.calls->get(call_handle, call);
    if (r == Result::kNotFound) {
        stats_.untracked.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG("Voicemail: transcription for unknown call=%s", call_handle.c_str());
        return Result::kOk;
    }
    if (r != Result::kOk) return r;

    if (status != "completed") {
        stats_.transcriptions_skipped.fetch_add(1, std::memory_order_relaxed);
        LOG_INFO("Voicemail: transcription for call=%s is %s, not stored",
                 call_handle.c_str(), status.c_str());
        return Result::kOk;
    }

    r = deps_.calls->attach_voicemail(call_handle, "", text);
    if (r != Result::kOk) {
        LOG_ERROR("Voicemail: transcription for call=%s not stored: %s",
                  call_handle.c_str(), result_to_string(r));
        return r;
    }
    stats_.transcriptions.fetch_add(1, std::memory_order_relaxed);
    return mark_completed(call_handle, call.queue_entry_id);
}

Result VoicemailFinisher::mark_completed(const std::string& call_handle,
                                         const std::string& queue_entry_id) {
    // No-op when the answer path already recorded the voicemail outcome
    Result r = deps_.queue->mark_outcome(queue_entry_id, Disposition::kVoicemail);
    if (r == Result::kNotFound) {
        LOG_DEBUG("Voicemail: entry=%s for call=%s no longer queued",
                  queue_entry_id.c_str(), call_handle.c_str());
        return Result::kOk;
    }
    return r;
}

} // namespace turbo_dialer

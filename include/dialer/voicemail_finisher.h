// =============================================================================
// FILE: include/dialer/voicemail_finisher.h
// =============================================================================
#ifndef VOICEMAIL_FINISHER_H
#define VOICEMAIL_FINISHER_H

#include "common/types.h"
#include "telephony/voice_response.h"
#include <atomic>
#include <string>

namespace turbo_dialer {

class QueueStore;
class CallAttemptStore;

// Attaches the message a lead left when no rep could take the call.
class VoicemailFinisher {
public:
    struct Dependencies {
        QueueStore*       queue = nullptr;
        CallAttemptStore* calls = nullptr;
    };

    explicit VoicemailFinisher(const Dependencies& deps);

    // Record action callback. Always answers with goodbye + hangup.
    VoiceResponse handle_recording(const std::string& call_handle,
                                   const std::string& recording_url);

    // Transcription callback; only a "completed" transcription is stored.
    Result handle_transcription(const std::string& call_handle, const std::string& text,
                                const std::string& transcription_status);

    struct Stats {
        std::atomic<uint64_t> recordings{0};
        std::atomic<uint64_t> transcriptions{0};
        std::atomic<uint64_t> transcriptions_skipped{0};
        std::atomic<uint64_t> untracked{0};
    };
    const Stats& stats() const { return stats_; }

    VoicemailFinisher(const VoicemailFinisher&) = delete;
    VoicemailFinisher& operator=(const VoicemailFinisher&) = delete;

private:
    Result mark_completed(const std::string& call_handle, const std::string& queue_entry_id);

    Dependencies deps_;
    Stats stats_;
};

} // namespace turbo_dialer
#endif // VOICEMAIL_FINISHER_H

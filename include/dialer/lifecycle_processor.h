// =============================================================================
// FILE: include/dialer/lifecycle_processor.h
// =============================================================================
#ifndef LIFECYCLE_PROCESSOR_H
#define LIFECYCLE_PROCESSOR_H

#include "common/types.h"
#include "model/call_attempt.h"
#include <atomic>
#include <string>

namespace turbo_dialer {

class QueueStore;
class RepPool;
class CallAttemptStore;
class CrmGateway;

struct CallStatusEvent {
    std::string call_handle;
    std::string provider_status;   // "ringing", "in-progress", "no-answer", ...
    int         duration_sec = 0;
    std::string recording_url;
};

struct ConferenceEvent {
    std::string session_id;
    std::string event;             // "participant-join", "participant-leave", "conference-end", ...
    std::string call_handle;
    std::string conference_sid;
    std::string conference_name;   // FriendlyName; one per claim
};

// Applies provider call-status and conference-membership events.
//
// One transition table (can_transition) guards every write, so duplicated and
// reordered deliveries converge: only the delivery whose terminal write lands
// records the queue outcome, credits the rep and runs the post-terminal hook.
// Every terminal delivery, winning or not, releases the rep the call held.
// The end of a claim's conference frees that claim only; the rep session
// itself stays open until the rep stops it.
class LifecycleProcessor {
public:
    struct Dependencies {
        QueueStore*       queue = nullptr;
        RepPool*          reps  = nullptr;
        CallAttemptStore* calls = nullptr;
        CrmGateway*       crm   = nullptr;
    };

    enum class Outcome {
        kApplied,     // state moved
        kReplay,      // already there or past it
        kIgnored,     // nothing to do for this event
        kUntracked,   // unknown call or session
        kError        // store failure; provider still gets its 200
    };

    explicit LifecycleProcessor(const Dependencies& deps);

    Outcome handle_call_status(const CallStatusEvent& event);
    Outcome handle_conference_event(const ConferenceEvent& event);

    struct Stats {
        std::atomic<uint64_t> status_events{0};
        std::atomic<uint64_t> conference_events{0};
        std::atomic<uint64_t> terminal_applied{0};
        std::atomic<uint64_t> replays{0};
        std::atomic<uint64_t> untracked{0};
        std::atomic<uint64_t> reps_released{0};
        std::atomic<uint64_t> conferences_ended{0};
    };
    const Stats& stats() const { return stats_; }

    LifecycleProcessor(const LifecycleProcessor&) = delete;
    LifecycleProcessor& operator=(const LifecycleProcessor&) = delete;

private:
    Outcome apply_progress(const CallAttempt& current, const CallUpdate& update);
    Outcome apply_terminal(const CallAttempt& current, const CallUpdate& update);
    void post_terminal(const CallAttempt& before, const CallUpdate& update);
    void release_backstop(const CallAttempt& call);

    Dependencies deps_;
    Stats stats_;
};

const char* lifecycle_outcome_to_string(LifecycleProcessor::Outcome o);

} // namespace turbo_dialer
#endif // LIFECYCLE_PROCESSOR_H

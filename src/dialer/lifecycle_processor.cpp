// =============================================================================
// FILE: src/dialer/lifecycle_processor.cpp
// =============================================================================
#include "dialer/lifecycle_processor.h"
#include "persistence/queue_store.h"
#include "persistence/rep_pool.h"
#include "persistence/call_attempt_store.h"
#include "crm/crm_gateway.h"
#include "common/logger.h"

namespace turbo_dialer {

const char* lifecycle_outcome_to_string(LifecycleProcessor::Outcome o) {
    switch (o) {
        case LifecycleProcessor::Outcome::kApplied:   return "applied";
        case LifecycleProcessor::Outcome::kReplay:    return "replay";
        case LifecycleProcessor::Outcome::kIgnored:   return "ignored";
        case LifecycleProcessor::Outcome::kUntracked: return "untracked";
        case LifecycleProcessor::Outcome::kError:     return "error";
        default:                                      return "unknown";
    }
}

LifecycleProcessor::LifecycleProcessor(const Dependencies& deps) : deps_(deps) {}

LifecycleProcessor::Outcome LifecycleProcessor::handle_call_status(const CallStatusEvent& ev) {
    stats_.status_events.fetch_add(1, std::memory_order_relaxed);

    auto mapped = map_provider_status(ev.provider_status);
    if (!mapped) {
        LOG_DEBUG("Lifecycle: call=%s status '%s' not tracked",
                  ev.call_handle.c_str(), ev.provider_status.c_str());
        return Outcome::kIgnored;
    }

    CallAttempt current;
    Result r = deps_.calls->get(ev.call_handle, current);
    if (r == Result::kNotFound) {
        stats_.untracked.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG("Lifecycle: call=%s not a dialer call, dropped", ev.call_handle.c_str());
        return Outcome::kUntracked;
    }
    if (r != Result::kOk) {
        LOG_ERROR("Lifecycle: call=%s lookup failed: %s",
                  ev.call_handle.c_str(), result_to_string(r));
        return Outcome::kError;
    }

    EpochMs now = now_epoch_ms();
    CallUpdate u{*mapped};
    switch (*mapped) {
        case CallStatus::kRinging:  u.ringing_at = now;  break;
        case CallStatus::kAnswered: u.answered_at = now; break;
        default: break;
    }

    if (!is_terminal(*mapped)) return apply_progress(current, u);

    u.ended_at      = now;
    u.duration_sec  = ev.duration_sec;
    u.recording_url = ev.recording_url;
    return apply_terminal(current, u);
}

LifecycleProcessor::Outcome LifecycleProcessor::apply_progress(const CallAttempt& current,
                                                               const CallUpdate& u) {
    Result r = deps_.calls->transition(current.call_handle, u);
    if (r == Result::kConflict) {
        LOG_DEBUG("Lifecycle: call=%s %s after %s ignored", current.call_handle.c_str(),
                  call_status_to_string(u.status), call_status_to_string(current.status));
        return Outcome::kReplay;
    }
    if (r != Result::kOk) {
        LOG_ERROR("Lifecycle: call=%s transition to %s failed: %s", current.call_handle.c_str(),
                  call_status_to_string(u.status), result_to_string(r));
        return Outcome::kError;
    }

    QueueStatus q = u.status == CallStatus::kRinging ? QueueStatus::kRinging
                                                     : QueueStatus::kAnswered;
    if (u.status == CallStatus::kRinging || u.status == CallStatus::kAnswered) {
        r = deps_.queue->advance(current.queue_entry_id, q);
        if (r != Result::kOk && r != Result::kConflict) {
            LOG_WARN("Lifecycle: entry=%s not advanced to %s: %s",
                     current.queue_entry_id.c_str(), queue_status_to_string(q),
                     result_to_string(r));
        }
    }
    return Outcome::kApplied;
}

LifecycleProcessor::Outcome LifecycleProcessor::apply_terminal(const CallAttempt& current,
                                                               const CallUpdate& u) {
    CallAttempt before;
    Result r = deps_.calls->transition(current.call_handle, u, {}, &before);

    Outcome outcome;
    if (r == Result::kOk) {
        stats_.terminal_applied.fetch_add(1, std::memory_order_relaxed);
        post_terminal(before, u);
        release_backstop(before);
        outcome = Outcome::kApplied;
    } else if (r == Result::kConflict) {
        stats_.replays.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG("Lifecycle: call=%s already %s, %s is a replay", current.call_handle.c_str(),
                  call_status_to_string(current.status), call_status_to_string(u.status));
        release_backstop(current);
        outcome = Outcome::kReplay;
    } else {
        LOG_ERROR("Lifecycle: call=%s terminal %s failed: %s", current.call_handle.c_str(),
                  call_status_to_string(u.status), result_to_string(r));
        // Compensate anyway so a dead call does not pin the rep
        release_backstop(current);
        outcome = Outcome::kError;
    }
    return outcome;
}

void LifecycleProcessor::post_terminal(const CallAttempt& before, const CallUpdate& u) {
    Disposition disp = disposition_for(before.status, u.status);
    LOG_INFO("Lifecycle: call=%s lead=%s %s -> %s (disposition %s, %ds)",
             before.call_handle.c_str(), before.lead_id.c_str(),
             call_status_to_string(before.status), call_status_to_string(u.status),
             disposition_to_string(disp), u.duration_sec);

    Result r = deps_.queue->mark_outcome(before.queue_entry_id, disp);
    if (r != Result::kOk) {
        LOG_ERROR("Lifecycle: entry=%s outcome %s not recorded: %s",
                  before.queue_entry_id.c_str(), disposition_to_string(disp),
                  result_to_string(r));
    }

    if (u.duration_sec > 0 && !before.session_id.empty()) {
        r = deps_.reps->increment_connected(before.session_id);
        if (r != Result::kOk) {
            LOG_DEBUG("Lifecycle: session=%s connected counter not updated: %s",
                      before.session_id.c_str(), result_to_string(r));
        }
    }

    CallAttempt after = before;
    apply_call_update(after, u);
    r = deps_.crm->complete_call_record(after);
    if (r != Result::kOk) {
        LOG_WARN("Lifecycle: CRM completion for call=%s failed: %s",
                 after.call_handle.c_str(), result_to_string(r));
    }
}

void LifecycleProcessor::release_backstop(const CallAttempt& call) {
    if (call.session_id.empty()) return;
    Result r = deps_.reps->release_rep(call.session_id, call.conference_name);
    if (r == Result::kOk) {
        stats_.reps_released.fetch_add(1, std::memory_order_relaxed);
        LOG_INFO("Lifecycle: rep=%s released after call=%s",
                 call.assigned_rep_id.c_str(), call.call_handle.c_str());
    } else if (r != Result::kNotFound) {
        LOG_ERROR("Lifecycle: release of session=%s failed: %s",
                  call.session_id.c_str(), result_to_string(r));
    }
}

LifecycleProcessor::Outcome LifecycleProcessor::handle_conference_event(const ConferenceEvent& ev) {
    stats_.conference_events.fetch_add(1, std::memory_order_relaxed);

    RepSession session;
    Result r = deps_.reps->get(ev.session_id, session);
    if (r == Result::kNotFound) {
        stats_.untracked.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG("Lifecycle: conference event %s for unknown session=%s",
                  ev.event.c_str(), ev.session_id.c_str());
        return Outcome::kUntracked;
    }
    if (r != Result::kOk) {
        LOG_ERROR("Lifecycle: session=%s lookup failed: %s",
                  ev.session_id.c_str(), result_to_string(r));
        return Outcome::kError;
    }

    if (ev.event == "participant-join" || ev.event == "join") {
        LOG_INFO("Lifecycle: call=%s joined conference of rep=%s",
                 ev.call_handle.c_str(), session.rep_id.c_str());
        return Outcome::kIgnored;
    }

    if (ev.event == "participant-leave" || ev.event == "leave") {
        if (session.availability != RepAvailability::kClaimed ||
            session.claimed_call_handle != ev.call_handle) {
            return Outcome::kIgnored;
        }
        r = deps_.reps->release_rep(session.session_id, session.conference_name);
        if (r == Result::kNotFound) return Outcome::kReplay;
        if (r != Result::kOk) {
            LOG_ERROR("Lifecycle: release of session=%s failed: %s",
                      session.session_id.c_str(), result_to_string(r));
            return Outcome::kError;
        }
        stats_.reps_released.fetch_add(1, std::memory_order_relaxed);
        LOG_INFO("Lifecycle: lead call=%s left, rep=%s available again",
                 ev.call_handle.c_str(), session.rep_id.c_str());
        return Outcome::kApplied;
    }

    if (ev.event == "conference-end" || ev.event == "end") {
        // An older claim's room ending must not free the claim that followed it
        if (ev.conference_name.empty() ||
            session.availability != RepAvailability::kClaimed ||
            session.conference_name != ev.conference_name) {
            LOG_DEBUG("Lifecycle: conference=%s of session=%s ended, no live claim on it",
                      ev.conference_name.empty() ? "-" : ev.conference_name.c_str(),
                      session.session_id.c_str());
            return Outcome::kIgnored;
        }
        r = deps_.reps->release_rep(session.session_id, ev.conference_name);
        if (r == Result::kNotFound) return Outcome::kReplay;
        if (r != Result::kOk) {
            LOG_ERROR("Lifecycle: release of session=%s failed: %s",
                      session.session_id.c_str(), result_to_string(r));
            return Outcome::kError;
        }
        stats_.conferences_ended.fetch_add(1, std::memory_order_relaxed);
        stats_.reps_released.fetch_add(1, std::memory_order_relaxed);
        LOG_INFO("Lifecycle: conference=%s of rep=%s ended, session=%s stays open",
                 ev.conference_name.c_str(), session.rep_id.c_str(), session.session_id.c_str());
        return Outcome::kApplied;
    }

    LOG_DEBUG("Lifecycle: conference event %s for session=%s not handled",
              ev.event.c_str(), ev.session_id.c_str());
    return Outcome::kIgnored;
}

} // namespace turbo_dialer

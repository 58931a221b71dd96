// =============================================================================
// FILE: src/dialer/dispatch_launcher.cpp
// =============================================================================
#include "dialer/dispatch_launcher.h"
#include "dialer/caller_id_pool.h"
#include "persistence/queue_store.h"
#include "persistence/rep_pool.h"
#include "persistence/call_attempt_store.h"
#include "model/call_attempt.h"
#include "telephony/telephony_provider.h"
#include "common/slow_handler_logger.h"
#include "common/phone_number.h"
#include "common/ids.h"
#include "common/logger.h"

#include <algorithm>

namespace turbo_dialer {

namespace {

void fail_entry(QueueStore& queue, const QueueEntry& entry) {
    Result r = queue.mark_outcome(entry.id, Disposition::kFailed);
    if (r != Result::kOk) {
        LOG_ERROR("Dispatch: entry=%s could not be marked failed: %s",
                  entry.id.c_str(), result_to_string(r));
    }
}

} // namespace

DispatchLauncher::DispatchLauncher(const Config& config, const Dependencies& deps)
    : leads_per_rep_(config.leads_per_rep)
    , max_batch_size_(config.max_batch_size)
    , ring_timeout_(config.ring_timeout)
    , machine_detection_timeout_(config.machine_detection_timeout)
    , urls_(config.public_base_url)
    , deps_(deps)
{}

Result DispatchLauncher::run_dispatch_cycle(const OrgId& org_id, DispatchReport& report) {
    SlowHandlerLogger::Timer timer(*deps_.slow_logger, "dispatch-cycle", "", "org=" + org_id);
    stats_.cycles.fetch_add(1, std::memory_order_relaxed);

    if (deps_.caller_ids->default_number().empty()) {
        LOG_ERROR("Dispatch: org=%s no caller id configured, nothing dialed", org_id.c_str());
        return Result::kInvalidArgument;
    }

    Result r = deps_.reps->count_available(org_id, report.available_reps);
    if (r != Result::kOk) {
        LOG_ERROR("Dispatch: org=%s counting reps failed: %s", org_id.c_str(), result_to_string(r));
        return r;
    }
    if (report.available_reps == 0) {
        stats_.empty_cycles.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG("Dispatch: org=%s no available reps", org_id.c_str());
        return Result::kOk;
    }

    // Calls from earlier cycles still ringing count against the same reps
    std::vector<CallAttempt> active;
    r = deps_.calls->list_active(org_id, active);
    if (r != Result::kOk) {
        LOG_ERROR("Dispatch: org=%s listing calls in flight failed: %s",
                  org_id.c_str(), result_to_string(r));
        return r;
    }
    report.in_flight = static_cast<size_t>(std::count_if(active.begin(), active.end(),
        [](const CallAttempt& a) { return is_pre_answer(a.status); }));

    size_t budget = std::min(report.available_reps * leads_per_rep_, max_batch_size_);
    report.requested = budget > report.in_flight ? budget - report.in_flight : 0;
    if (report.requested == 0) {
        stats_.saturated_cycles.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG("Dispatch: org=%s %zu calls still ringing, nothing more to dial",
                  org_id.c_str(), report.in_flight);
        return Result::kOk;
    }

    std::vector<QueueEntry> entries;
    r = deps_.queue->next_batch(org_id, report.requested, entries);
    if (r != Result::kOk) {
        LOG_ERROR("Dispatch: org=%s next_batch failed: %s", org_id.c_str(), result_to_string(r));
        return r;
    }
    if (entries.empty()) {
        stats_.empty_cycles.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG("Dispatch: org=%s queue empty", org_id.c_str());
        return Result::kOk;
    }

    report.batch_id = generate_uuid();

    for (const auto& entry : entries) {
        std::string to = normalize_e164(entry.lead_phone);
        if (to.empty()) {
            LOG_WARN("Dispatch: entry=%s lead=%s phone '%s' not dialable",
                     entry.id.c_str(), entry.lead_id.c_str(), entry.lead_phone.c_str());
            fail_entry(*deps_.queue, entry);
            report.failed++;
            continue;
        }

        PlaceCallRequest req;
        req.to = to;
        req.from = deps_.caller_ids->pick(to);
        req.answer_url = urls_.lead_answered();
        req.status_callback_url = urls_.call_status();
        req.ring_timeout = ring_timeout_;
        req.machine_detection_timeout = machine_detection_timeout_;

        std::string handle;
        r = deps_.provider->place_call(req, handle);
        if (r != Result::kOk) {
            fail_entry(*deps_.queue, entry);
            report.failed++;
            continue;
        }

        CallAttempt attempt;
        attempt.call_handle    = handle;
        attempt.queue_entry_id = entry.id;
        attempt.org_id         = org_id;
        attempt.lead_id        = entry.lead_id;
        attempt.batch_id       = report.batch_id;
        attempt.status         = CallStatus::kDialing;
        attempt.caller_id      = req.from;
        attempt.to_number      = to;
        attempt.created_at     = now_epoch_ms();

        r = deps_.calls->create(attempt);
        if (r != Result::kOk && r != Result::kAlreadyExists) {
            // A live call nobody can correlate: stop it and let the entry retry
            LOG_ERROR("Dispatch: call=%s for entry=%s not recorded (%s), canceling",
                      handle.c_str(), entry.id.c_str(), result_to_string(r));
            if (deps_.provider->cancel_call(handle) != Result::kOk) {
                LOG_WARN("Dispatch: untracked call=%s may still ring", handle.c_str());
            }
            fail_entry(*deps_.queue, entry);
            report.failed++;
            continue;
        }

        report.dialed++;
        report.call_handles.push_back(handle);
    }

    stats_.calls_placed.fetch_add(report.dialed, std::memory_order_relaxed);
    stats_.calls_failed.fetch_add(report.failed, std::memory_order_relaxed);

    if (report.dialed > 0) {
        std::vector<RepSession> sessions;
        if (deps_.reps->list_by_org(org_id, sessions) == Result::kOk) {
            for (const auto& s : sessions) {
                if (s.availability != RepAvailability::kAvailable) continue;
                Result ir = deps_.reps->increment_dialed(s.session_id, report.dialed);
                if (ir != Result::kOk) {
                    LOG_DEBUG("Dispatch: session=%s dialed counter not updated: %s",
                              s.session_id.c_str(), result_to_string(ir));
                }
            }
        }
    }

    LOG_INFO("Dispatch: org=%s batch=%s reps=%zu in_flight=%zu requested=%zu dialed=%zu failed=%zu",
             org_id.c_str(), report.batch_id.c_str(), report.available_reps,
             report.in_flight, report.requested, report.dialed, report.failed);
    return Result::kOk;
}

} // namespace turbo_dialer

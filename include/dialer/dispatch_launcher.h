// =============================================================================
// FILE: include/dialer/dispatch_launcher.h
// =============================================================================
#ifndef DISPATCH_LAUNCHER_H
#define DISPATCH_LAUNCHER_H

#include "common/config.h"
#include "common/types.h"
#include "dialer/callback_urls.h"
#include <atomic>
#include <string>
#include <vector>

namespace turbo_dialer {

class QueueStore;
class RepPool;
class CallAttemptStore;
class TelephonyProvider;
class CallerIdPool;
class SlowHandlerLogger;

struct DispatchReport {
    std::string batch_id;            // empty when nothing was dialed
    size_t      available_reps = 0;
    size_t      in_flight      = 0;  // org calls still dialing or ringing
    size_t      requested      = 0;  // min(available * leads_per_rep, max_batch_size) - in_flight
    size_t      dialed         = 0;
    size_t      failed         = 0;
    std::vector<std::string> call_handles;
};

// One dispatch cycle for an org: size the batch from the available reps less
// the org's calls that have not been answered yet, claim queued entries, place one provider call per entry and record the
// attempts under a fresh batch id. A provider rejection fails only that
// entry; the rest of the batch is still dialed.
class DispatchLauncher {
public:
    struct Dependencies {
        QueueStore*         queue       = nullptr;
        RepPool*            reps        = nullptr;
        CallAttemptStore*   calls       = nullptr;
        TelephonyProvider*  provider    = nullptr;
        const CallerIdPool* caller_ids  = nullptr;
        SlowHandlerLogger*  slow_logger = nullptr;
    };

    DispatchLauncher(const Config& config, const Dependencies& deps);

    Result run_dispatch_cycle(const OrgId& org_id, DispatchReport& report);

    struct Stats {
        std::atomic<uint64_t> cycles{0};
        std::atomic<uint64_t> empty_cycles{0};
        std::atomic<uint64_t> saturated_cycles{0};   // earlier batches still ringing
        std::atomic<uint64_t> calls_placed{0};
        std::atomic<uint64_t> calls_failed{0};
    };
    const Stats& stats() const { return stats_; }

    DispatchLauncher(const DispatchLauncher&) = delete;
    DispatchLauncher& operator=(const DispatchLauncher&) = delete;

private:
    size_t leads_per_rep_;
    size_t max_batch_size_;
    Seconds ring_timeout_;
    Seconds machine_detection_timeout_;
    CallbackUrls urls_;
    Dependencies deps_;
    Stats stats_;
};

} // namespace turbo_dialer
#endif // DISPATCH_LAUNCHER_H

// =============================================================================
// FILE: include/dispatch/dispatch_scheduler.h
// =============================================================================
#ifndef DISPATCH_SCHEDULER_H
#define DISPATCH_SCHEDULER_H
#include "common/types.h"
#include "common/config.h"
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
namespace turbo_dialer {
class DispatchLauncher;
class RepPool;

// Runs a dispatch cycle for every org with available reps once per
// dialer.dispatch_interval_sec. Cycles of different orgs run one after the
// other on this thread; NextBatch keeps a concurrent manual /turbo/dial from
// dialing the same entries.
class DispatchScheduler {
public:
    DispatchScheduler(const Config& config, DispatchLauncher& launcher, RepPool& reps);
    ~DispatchScheduler();
    Result start();
    void stop();

    // One sweep over the active orgs; returns the number of calls placed.
    size_t run_once();

    struct SchedulerStats {
        std::atomic<uint64_t> sweeps{0};
        std::atomic<uint64_t> org_cycles{0};
        std::atomic<uint64_t> cycle_errors{0};
        std::atomic<uint64_t> calls_placed{0};
    };
    const SchedulerStats& stats() const { return stats_; }
    DispatchScheduler(const DispatchScheduler&) = delete;
    DispatchScheduler& operator=(const DispatchScheduler&) = delete;
private:
    void run();
    Seconds interval_;
    DispatchLauncher& launcher_;
    RepPool& reps_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex mu_;
    std::condition_variable cv_;
    SchedulerStats stats_;
};
} // namespace turbo_dialer
#endif

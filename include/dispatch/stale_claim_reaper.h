// =============================================================================
// FILE: include/dispatch/stale_claim_reaper.h
// =============================================================================
#ifndef STALE_CLAIM_REAPER_H
#define STALE_CLAIM_REAPER_H
#include "common/types.h"
#include "common/config.h"
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
namespace turbo_dialer {
class RepPool;
class CallAttemptStore;

// Frees reps whose claim outlived its call: the terminal webhook was lost, or
// the process died between claim and bridge. A claim is only released when
// the claimed call is unknown or already terminal; long live calls stay.
class StaleClaimReaper {
public:
    StaleClaimReaper(const Config& config, RepPool& reps, CallAttemptStore& calls);
    ~StaleClaimReaper();
    Result start();
    void stop();

    // One pass; also driven directly by tests.
    size_t scan_and_reap();

    struct ReaperStats {
        std::atomic<uint64_t> scan_count{0};
        std::atomic<uint64_t> claims_released{0};
        std::atomic<uint64_t> claims_kept{0};
        std::atomic<uint64_t> last_scan_duration_ms{0};
        std::atomic<uint64_t> last_scan_stale_count{0};
    };
    const ReaperStats& stats() const { return stats_; }
    StaleClaimReaper(const StaleClaimReaper&) = delete;
    StaleClaimReaper& operator=(const StaleClaimReaper&) = delete;
private:
    void run();
    Seconds scan_interval_;
    Seconds stale_after_;
    RepPool& reps_;
    CallAttemptStore& calls_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex mu_;
    std::condition_variable cv_;
    ReaperStats stats_;
};
} // namespace turbo_dialer
#endif

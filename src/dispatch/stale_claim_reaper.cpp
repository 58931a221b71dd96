// =============================================================================
// FILE: src/dispatch/stale_claim_reaper.cpp
// =============================================================================
#include "dispatch/stale_claim_reaper.h"
#include "persistence/rep_pool.h"
#include "persistence/call_attempt_store.h"
#include "common/logger.h"

#include <vector>

namespace turbo_dialer {

StaleClaimReaper::StaleClaimReaper(const Config& config, RepPool& reps, CallAttemptStore& calls)
    : scan_interval_(config.reaper_scan_interval)
    , stale_after_(config.stale_claim_timeout)
    , reps_(reps), calls_(calls)
{}

StaleClaimReaper::~StaleClaimReaper() { stop(); }

Result StaleClaimReaper::start() {
    if (running_.load()) return Result::kAlreadyExists;
    stop_requested_.store(false); running_.store(true);
    thread_ = std::thread(&StaleClaimReaper::run, this);
    return Result::kOk;
}

void StaleClaimReaper::stop() {
    if (!running_.load()) return;
    { std::lock_guard<std::mutex> lk(mu_); stop_requested_.store(true); }
    cv_.notify_one();
    if (thread_.joinable()) thread_.join();
    running_.store(false);
}

void StaleClaimReaper::run() {
    while (!stop_requested_.load()) {
        { std::unique_lock<std::mutex> lk(mu_);
          cv_.wait_for(lk, scan_interval_, [this]{ return stop_requested_.load(); }); }
        if (stop_requested_.load()) break;
        scan_and_reap();
    }
}

size_t StaleClaimReaper::scan_and_reap() {
    ScopedTimer timer;
    stats_.scan_count.fetch_add(1);

    EpochMs cutoff = now_epoch_ms() - std::chrono::duration_cast<Millisecs>(stale_after_).count();
    std::vector<RepSession> stale;
    Result r = reps_.list_stale_claims(cutoff, stale);
    if (r != Result::kOk) {
        LOG_ERROR("Reaper: listing stale claims failed: %s", result_to_string(r));
        return 0;
    }

    size_t released = 0;
    for (const auto& s : stale) {
        CallAttempt call;
        r = calls_.get(s.claimed_call_handle, call);
        if (r == Result::kOk && !is_terminal(call.status)) {
            stats_.claims_kept.fetch_add(1);
            continue;
        }
        if (r != Result::kOk && r != Result::kNotFound) {
            LOG_WARN("Reaper: call=%s lookup failed: %s, claim kept",
                     s.claimed_call_handle.c_str(), result_to_string(r));
            continue;
        }

        r = reps_.release_rep(s.session_id, s.conference_name);
        if (r == Result::kOk) {
            released++;
            LOG_WARN("Reaper: rep=%s org=%s held by dead call=%s, released",
                     s.rep_id.c_str(), s.org_id.c_str(), s.claimed_call_handle.c_str());
        } else if (r != Result::kNotFound) {
            LOG_ERROR("Reaper: release of session=%s failed: %s",
                      s.session_id.c_str(), result_to_string(r));
        }
    }

    stats_.claims_released.fetch_add(released);
    stats_.last_scan_duration_ms.store(timer.elapsed_ms().count());
    stats_.last_scan_stale_count.store(stale.size());
    if (released > 0) LOG_INFO("Reaper: %zu claims released in %ldms", released, timer.elapsed_ms().count());
    return released;
}

} // namespace turbo_dialer

// =============================================================================
// FILE: src/dispatch/dispatch_scheduler.cpp
// =============================================================================
#include "dispatch/dispatch_scheduler.h"
#include "dialer/dispatch_launcher.h"
#include "persistence/rep_pool.h"
#include "common/logger.h"

#include <vector>

namespace turbo_dialer {

DispatchScheduler::DispatchScheduler(const Config& config, DispatchLauncher& launcher,
                                     RepPool& reps)
    : interval_(config.dispatch_interval), launcher_(launcher), reps_(reps)
{}

DispatchScheduler::~DispatchScheduler() { stop(); }

Result DispatchScheduler::start() {
    if (running_.load()) return Result::kAlreadyExists;
    stop_requested_.store(false); running_.store(true);
    thread_ = std::thread(&DispatchScheduler::run, this);
    LOG_INFO("Dispatch scheduler started, interval %lds", static_cast<long>(interval_.count()));
    return Result::kOk;
}

void DispatchScheduler::stop() {
    if (!running_.load()) return;
    { std::lock_guard<std::mutex> lk(mu_); stop_requested_.store(true); }
    cv_.notify_one();
    if (thread_.joinable()) thread_.join();
    running_.store(false);
}

void DispatchScheduler::run() {
    while (!stop_requested_.load()) {
        { std::unique_lock<std::mutex> lk(mu_);
          cv_.wait_for(lk, interval_, [this]{ return stop_requested_.load(); }); }
        if (stop_requested_.load()) break;
        run_once();
    }
}

size_t DispatchScheduler::run_once() {
    stats_.sweeps.fetch_add(1);

    std::vector<OrgId> orgs;
    Result r = reps_.active_orgs(orgs);
    if (r != Result::kOk) {
        LOG_ERROR("Scheduler: listing active orgs failed: %s", result_to_string(r));
        return 0;
    }

    size_t placed = 0;
    for (const auto& org : orgs) {
        if (stop_requested_.load()) break;
        DispatchReport report;
        r = launcher_.run_dispatch_cycle(org, report);
        stats_.org_cycles.fetch_add(1);
        if (r != Result::kOk) {
            stats_.cycle_errors.fetch_add(1);
            continue;
        }
        placed += report.dialed;
    }
    stats_.calls_placed.fetch_add(placed);
    return placed;
}

} // namespace turbo_dialer

// =============================================================================
// FILE: src/common/slow_handler_logger.cpp
// =============================================================================
#include "common/slow_handler_logger.h"

namespace turbo_dialer {

SlowHandlerLogger::SlowHandlerLogger(const Config& config)
    : warn_ms_(config.slow_handler_warn_threshold.count())
    , error_ms_(config.slow_handler_error_threshold.count())
    , critical_ms_(config.slow_handler_critical_threshold.count())
{}

void SlowHandlerLogger::set_thresholds(Millisecs warn, Millisecs error, Millisecs critical) {
    warn_ms_.store(warn.count(), std::memory_order_relaxed);
    error_ms_.store(error.count(), std::memory_order_relaxed);
    critical_ms_.store(critical.count(), std::memory_order_relaxed);
}

SlowHandlerLogger::Thresholds SlowHandlerLogger::thresholds() const {
    return {
        Millisecs(warn_ms_.load(std::memory_order_relaxed)),
        Millisecs(error_ms_.load(std::memory_order_relaxed)),
        Millisecs(critical_ms_.load(std::memory_order_relaxed))
    };
}

void SlowHandlerLogger::check_and_log(const char* handler,
                                      const std::string& call_handle,
                                      const std::string& extra_context,
                                      Millisecs elapsed) {
    int64_t ms = elapsed.count();
    stats_.timed_count.fetch_add(1, std::memory_order_relaxed);

    uint64_t prev_max = stats_.max_duration_ms.load(std::memory_order_relaxed);
    while (static_cast<uint64_t>(ms) > prev_max) {
        if (stats_.max_duration_ms.compare_exchange_weak(prev_max, static_cast<uint64_t>(ms),
                std::memory_order_relaxed)) break;
    }

    const long shown = static_cast<long>(ms);
    if (ms >= critical_ms_.load(std::memory_order_relaxed)) {
        stats_.critical_count.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("SLOW_HANDLER CRITICAL: %s took %ldms call=%s %s",
                  handler, shown, call_handle.c_str(), extra_context.c_str());
    } else if (ms >= error_ms_.load(std::memory_order_relaxed)) {
        stats_.error_count.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("SLOW_HANDLER: %s took %ldms call=%s %s",
                  handler, shown, call_handle.c_str(), extra_context.c_str());
    } else if (ms >= warn_ms_.load(std::memory_order_relaxed)) {
        stats_.warn_count.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("SLOW_HANDLER: %s took %ldms call=%s %s",
                 handler, shown, call_handle.c_str(), extra_context.c_str());
    }
}

SlowHandlerLogger::Timer::Timer(SlowHandlerLogger& logger, const char* handler,
                                const std::string& call_handle, const std::string& extra)
    : logger_(logger), handler_(handler), call_handle_(call_handle)
    , extra_context_(extra), start_(Clock::now())
{}

SlowHandlerLogger::Timer::~Timer() {
    if (!finished_) finish();
}

void SlowHandlerLogger::Timer::finish() {
    if (finished_) return;
    finished_ = true;
    logger_.check_and_log(handler_, call_handle_, extra_context_, elapsed());
}

} // namespace turbo_dialer

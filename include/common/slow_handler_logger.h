// =============================================================================
// FILE: include/common/slow_handler_logger.h
// =============================================================================
#ifndef SLOW_HANDLER_LOGGER_H
#define SLOW_HANDLER_LOGGER_H

#include "common/types.h"
#include "common/config.h"
#include "common/logger.h"
#include <atomic>
#include <string>

namespace turbo_dialer {

// Flags webhook handlers and dispatch cycles that run long enough for the
// provider to notice (dead air on the lead's side, callback timeouts).
// Usage:
//   SlowHandlerLogger::Timer timer(slow_logger, "lead-answered", call_handle);
//   ... handle ...
//   timer.finish(); // or let the destructor call it
class SlowHandlerLogger {
public:
    explicit SlowHandlerLogger(const Config& config);

    void set_thresholds(Millisecs warn, Millisecs error, Millisecs critical);

    struct Thresholds {
        Millisecs warn;
        Millisecs error;
        Millisecs critical;
    };
    Thresholds thresholds() const;

    class Timer {
    public:
        Timer(SlowHandlerLogger& logger,
              const char* handler,
              const std::string& call_handle,
              const std::string& extra_context = "");
        ~Timer();

        void finish();

        Millisecs elapsed() const {
            return std::chrono::duration_cast<Millisecs>(Clock::now() - start_);
        }

    private:
        SlowHandlerLogger& logger_;
        const char* handler_;
        std::string call_handle_;
        std::string extra_context_;
        TimePoint start_;
        bool finished_ = false;
    };

    struct Stats {
        std::atomic<uint64_t> timed_count{0};
        std::atomic<uint64_t> warn_count{0};
        std::atomic<uint64_t> error_count{0};
        std::atomic<uint64_t> critical_count{0};
        std::atomic<uint64_t> max_duration_ms{0};
    };
    const Stats& stats() const { return stats_; }

private:
    friend class Timer;
    void check_and_log(const char* handler,
                       const std::string& call_handle,
                       const std::string& extra_context,
                       Millisecs elapsed);

    std::atomic<int64_t> warn_ms_;
    std::atomic<int64_t> error_ms_;
    std::atomic<int64_t> critical_ms_;
    Stats stats_;
};

} // namespace turbo_dialer
#endif // SLOW_HANDLER_LOGGER_H

// =============================================================================
// FILE: include/common/logger.h
// =============================================================================
#ifndef COMMON_LOGGER_H
#define COMMON_LOGGER_H

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <chrono>
#include <pthread.h>

namespace turbo_dialer {

enum class LogLevel {
    kTrace = 0,
    kDebug = 1,
    kInfo  = 2,
    kWarn  = 3,
    kError = 4,
    kFatal = 5
};

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::kTrace: return "TRACE";
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo:  return "INFO";
        case LogLevel::kWarn:  return "WARN";
        case LogLevel::kError: return "ERROR";
        case LogLevel::kFatal: return "FATAL";
        default:               return "UNKNOWN";
    }
}

// Case-insensitive; "warning" is accepted. Anything else is INFO.
LogLevel parse_log_level(const std::string& s);

// One size-rotated log file: <path>, <path>.1 ... <path>.<keep_files>.
struct RotatingFileConfig {
    std::string path;
    size_t   max_bytes     = 50 * 1024 * 1024;
    int      keep_files    = 10;
    LogLevel min_level     = LogLevel::kTrace;
    bool     mirror_stderr = false;
};

class RotatingFile {
public:
    explicit RotatingFile(const RotatingFileConfig& config);
    ~RotatingFile();

    void write(LogLevel level, const char* line, size_t len);
    void flush();

    const std::string& path() const { return config_.path; }

    RotatingFile(const RotatingFile&) = delete;
    RotatingFile& operator=(const RotatingFile&) = delete;

private:
    void open();
    void close();
    void shift_and_reopen();

    RotatingFileConfig config_;
    std::mutex mu_;
    FILE* fp_ = nullptr;
    size_t size_ = 0;
};

// Tags every log line written on this thread with the call being handled:
//
//   CallLogScope scope(call_handle);
//   LOG_INFO("...");   // ... [call:CA123] ...
//
// Scopes nest; the innermost wins and the outer one is restored on exit.
class CallLogScope {
public:
    explicit CallLogScope(const std::string& call_handle);
    ~CallLogScope();

    // "" outside any scope
    static const std::string& current();

    CallLogScope(const CallLogScope&) = delete;
    CallLogScope& operator=(const CallLogScope&) = delete;

private:
    std::string previous_;
};

// Process-wide logger.
//
// configure() creates four rotating files under log_dir:
//   <base>.log          INFO and above (mirrored to stderr per console level)
//   <base>_debug.log    everything
//   <base>_error.log    ERROR and FATAL
//   <base>_webhook.log  one line per inbound provider callback (LOG_WEBHOOK)
//
// The webhook file is the audit trail used to replay a call's history when a
// rep reports a dropped or misrouted call. Until configure() runs, everything
// goes to stderr.
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    LogLevel level() const { return level_.load(std::memory_order_relaxed); }

    void configure(const std::string& log_dir,
                   const std::string& base_name,
                   LogLevel console_level,
                   size_t max_file_size_bytes,
                   int max_rotated_files);

    void log(LogLevel level, const char* file, int line, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));

    void log_webhook(const char* file, int line, const char* fmt, ...)
        __attribute__((format(printf, 4, 5)));

    void flush_all();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();
    ~Logger();

    static size_t format_line(char* buf, size_t buf_size,
                              LogLevel level, const char* file, int line,
                              const char* fmt, va_list args);

    std::atomic<LogLevel> level_;
    std::mutex configure_mu_;
    std::vector<std::unique_ptr<RotatingFile>> files_;
    std::unique_ptr<RotatingFile> webhook_file_;
    std::atomic<bool> configured_{false};
};

// Logging macros
#define LOG_TRACE(fmt, ...) \
    turbo_dialer::Logger::instance().log(turbo_dialer::LogLevel::kTrace, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) \
    turbo_dialer::Logger::instance().log(turbo_dialer::LogLevel::kDebug, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) \
    turbo_dialer::Logger::instance().log(turbo_dialer::LogLevel::kInfo, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) \
    turbo_dialer::Logger::instance().log(turbo_dialer::LogLevel::kWarn, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) \
    turbo_dialer::Logger::instance().log(turbo_dialer::LogLevel::kError, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) \
    turbo_dialer::Logger::instance().log(turbo_dialer::LogLevel::kFatal, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_WEBHOOK(fmt, ...) \
    turbo_dialer::Logger::instance().log_webhook(__FILE__, __LINE__, fmt, ##__VA_ARGS__)

} // namespace turbo_dialer
#endif // COMMON_LOGGER_H

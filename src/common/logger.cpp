// =============================================================================
// FILE: src/common/logger.cpp
// =============================================================================
#include "common/logger.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace turbo_dialer {

namespace {

thread_local std::string t_call_handle;

constexpr size_t kLineBytes = 4096;

} // namespace

LogLevel parse_log_level(const std::string& s) {
    std::string v(s);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "trace") return LogLevel::kTrace;
    if (v == "debug") return LogLevel::kDebug;
    if (v == "warn" || v == "warning") return LogLevel::kWarn;
    if (v == "error") return LogLevel::kError;
    if (v == "fatal") return LogLevel::kFatal;
    return LogLevel::kInfo;
}

// =============================================================================
// RotatingFile
// =============================================================================

RotatingFile::RotatingFile(const RotatingFileConfig& config) : config_(config) {
    open();
}

RotatingFile::~RotatingFile() {
    std::lock_guard<std::mutex> lk(mu_);
    close();
}

void RotatingFile::open() {
    if (config_.path.empty()) { fp_ = stderr; return; }

    fp_ = fopen(config_.path.c_str(), "a");
    if (!fp_) {
        fprintf(stderr, "LOGGER: cannot open '%s' (%s), writing to stderr\n",
                config_.path.c_str(), strerror(errno));
        fp_ = stderr;
        return;
    }
    struct stat st;
    size_ = fstat(fileno(fp_), &st) == 0 ? static_cast<size_t>(st.st_size) : 0;
}

void RotatingFile::close() {
    if (fp_ && fp_ != stderr) {
        fflush(fp_);
        fclose(fp_);
    }
    fp_ = nullptr;
}

void RotatingFile::shift_and_reopen() {
    close();
    auto numbered = [this](int i) { return config_.path + "." + std::to_string(i); };

    std::remove(numbered(config_.keep_files).c_str());
    for (int i = config_.keep_files - 1; i >= 1; --i) {
        std::rename(numbered(i).c_str(), numbered(i + 1).c_str());
    }
    std::rename(config_.path.c_str(), numbered(1).c_str());

    size_ = 0;
    open();
}

void RotatingFile::write(LogLevel level, const char* line, size_t len) {
    if (level < config_.min_level) return;

    std::lock_guard<std::mutex> lk(mu_);
    if (!fp_) return;
    if (fp_ != stderr && config_.max_bytes > 0 && size_ >= config_.max_bytes) {
        shift_and_reopen();
    }

    size_ += fwrite(line, 1, len, fp_);
    if (config_.mirror_stderr && fp_ != stderr) fwrite(line, 1, len, stderr);
    if (level >= LogLevel::kWarn) fflush(fp_);
}

void RotatingFile::flush() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fp_) fflush(fp_);
}

// =============================================================================
// CallLogScope
// =============================================================================

CallLogScope::CallLogScope(const std::string& call_handle) : previous_(t_call_handle) {
    t_call_handle = call_handle;
}

CallLogScope::~CallLogScope() {
    t_call_handle.swap(previous_);
}

const std::string& CallLogScope::current() {
    return t_call_handle;
}

// =============================================================================
// Logger
// =============================================================================

Logger::Logger() : level_(LogLevel::kInfo) {}

Logger::~Logger() {
    flush_all();
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::configure(const std::string& log_dir,
                       const std::string& base_name,
                       LogLevel console_level,
                       size_t max_file_size_bytes,
                       int max_rotated_files) {
    std::lock_guard<std::mutex> lk(configure_mu_);
    configured_.store(false, std::memory_order_release);
    files_.clear();
    webhook_file_.reset();

    if (!log_dir.empty() && mkdir(log_dir.c_str(), 0755) != 0 && errno != EEXIST) {
        fprintf(stderr, "LOGGER: cannot create '%s': %s\n", log_dir.c_str(), strerror(errno));
    }
    const std::string prefix = log_dir.empty() ? base_name : log_dir + "/" + base_name;

    struct FileSpec {
        const char* suffix;
        LogLevel    min_level;
        int         keep;
        bool        mirror;
    };
    const FileSpec specs[] = {
        {".log",       LogLevel::kInfo,  max_rotated_files,     console_level <= LogLevel::kInfo},
        {"_debug.log", LogLevel::kTrace, max_rotated_files / 2, false},
        {"_error.log", LogLevel::kError, max_rotated_files,     true},
    };
    auto make = [&](const char* suffix, LogLevel min_level, int keep, bool mirror) {
        RotatingFileConfig cfg;
        cfg.path          = prefix + suffix;
        cfg.max_bytes     = max_file_size_bytes;
        cfg.keep_files    = std::max(1, keep);
        cfg.min_level     = min_level;
        cfg.mirror_stderr = mirror;
        return std::make_unique<RotatingFile>(cfg);
    };
    for (const auto& s : specs) files_.push_back(make(s.suffix, s.min_level, s.keep, s.mirror));
    webhook_file_ = make("_webhook.log", LogLevel::kTrace, max_rotated_files, false);

    configured_.store(true, std::memory_order_release);
    fprintf(stderr, "Logger configured: %s.log (+_debug, _error, _webhook) max_size=%zu keep=%d\n",
            prefix.c_str(), max_file_size_bytes, max_rotated_files);
}

size_t Logger::format_line(char* buf, size_t buf_size,
                           LogLevel level, const char* file, int line,
                           const char* fmt, va_list args) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    const char* base = strrchr(file, '/');
    base = base ? base + 1 : file;

    const std::string& call = CallLogScope::current();
    int head = snprintf(buf, buf_size,
        "%04d-%02d-%02d %02d:%02d:%02d.%03d [%s] [tid:%lu] [%s:%d] %s%s%s",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
        static_cast<int>(ms.count()), log_level_name(level),
        static_cast<unsigned long>(pthread_self()), base, line,
        call.empty() ? "" : "[call:", call.c_str(), call.empty() ? "" : "] ");
    if (head < 0 || static_cast<size_t>(head) >= buf_size) return 0;

    int body = vsnprintf(buf + head, buf_size - static_cast<size_t>(head), fmt, args);
    size_t total = static_cast<size_t>(head) + (body > 0 ? static_cast<size_t>(body) : 0);
    if (total > buf_size - 2) total = buf_size - 2;  // truncated

    buf[total] = '\n';
    buf[total + 1] = '\0';
    return total + 1;
}

void Logger::log(LogLevel level, const char* file, int line, const char* fmt, ...) {
    if (level < level_.load(std::memory_order_relaxed)) return;

    char buf[kLineBytes];
    va_list args;
    va_start(args, fmt);
    size_t len = format_line(buf, sizeof(buf), level, file, line, fmt, args);
    va_end(args);
    if (len == 0) return;

    if (!configured_.load(std::memory_order_acquire)) {
        fwrite(buf, 1, len, stderr);
        if (level >= LogLevel::kWarn) fflush(stderr);
        return;
    }

    for (auto& f : files_) f->write(level, buf, len);
    if (level == LogLevel::kFatal) flush_all();
}

void Logger::log_webhook(const char* file, int line, const char* fmt, ...) {
    char buf[kLineBytes];
    va_list args;
    va_start(args, fmt);
    size_t len = format_line(buf, sizeof(buf), LogLevel::kInfo, file, line, fmt, args);
    va_end(args);
    if (len == 0) return;

    if (configured_.load(std::memory_order_acquire) && webhook_file_) {
        webhook_file_->write(LogLevel::kInfo, buf, len);
    } else if (level_.load(std::memory_order_relaxed) <= LogLevel::kDebug) {
        fwrite(buf, 1, len, stderr);
    }
}

void Logger::flush_all() {
    for (auto& f : files_) f->flush();
    if (webhook_file_) webhook_file_->flush();
}

} // namespace turbo_dialer

// =============================================================================
// FILE: include/common/types.h
// =============================================================================
#ifndef COMMON_TYPES_H
#define COMMON_TYPES_H

#include <cstdint>
#include <chrono>
#include <string>

namespace turbo_dialer {

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millisecs = std::chrono::milliseconds;
using Seconds   = std::chrono::seconds;
using OrgId     = std::string;

// Persisted timestamps are wall-clock milliseconds since the epoch.
using EpochMs   = int64_t;

inline EpochMs now_epoch_ms() {
    return std::chrono::duration_cast<Millisecs>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Outcome of every store, provider and gateway operation. Nothing throws
// across a component boundary; adapters convert library exceptions here.
enum class Result {
    kOk,
    kNotFound,           // no such entry / session / call
    kAlreadyExists,
    kNotAvailable,       // no rep free to claim
    kConflict,           // conditional write lost to a concurrent writer
    kInvalidArgument,
    kTimeout,
    kConnectionLost,
    kPersistenceError,
    kProviderError,      // telephony or CRM rejected the request
    kError
};

inline const char* result_to_string(Result r) {
    switch (r) {
        case Result::kOk:                return "OK";
        case Result::kNotFound:          return "NotFound";
        case Result::kAlreadyExists:     return "AlreadyExists";
        case Result::kNotAvailable:      return "NotAvailable";
        case Result::kConflict:          return "Conflict";
        case Result::kInvalidArgument:   return "InvalidArgument";
        case Result::kTimeout:           return "Timeout";
        case Result::kConnectionLost:    return "ConnectionLost";
        case Result::kPersistenceError:  return "PersistenceError";
        case Result::kProviderError:     return "ProviderError";
        case Result::kError:             return "Error";
    }
    return "Unknown";
}

// Measures from construction; used for store latency and reaper passes.
class ScopedTimer {
public:
    ScopedTimer() : start_(Clock::now()) {}

    Millisecs elapsed_ms() const {
        return std::chrono::duration_cast<Millisecs>(Clock::now() - start_);
    }

private:
    TimePoint start_;
};

} // namespace turbo_dialer
#endif // COMMON_TYPES_H

// =============================================================================
// FILE: include/persistence/mongo_client.h
// =============================================================================
#ifndef MONGO_CLIENT_H
#define MONGO_CLIENT_H

#include "common/types.h"
#include "common/config.h"
#include <memory>
#include <atomic>
#include <string>

// Forward declarations, mongo headers stay in the .cpp files
namespace mongocxx { inline namespace v_noabi {
    class instance;
    class pool;
    class client;
    class database;
    class collection;
}}

namespace turbo_dialer {

// MongoDB pool shared by the queue, rep pool and call attempt stores. Each
// store operation borrows a pooled client for its duration, so concurrent
// webhook deliveries never share one.
//
// Operation stats separate real failures from conditional writes that lost a
// race (kConflict, kNotAvailable): a rising conflict count with a flat error
// count means contention on reps or calls, not a sick database.
class MongoClient {
public:
    explicit MongoClient(const Config& config);
    ~MongoClient();

    Result connect();
    void disconnect();
    bool is_connected() const { return connected_.load(std::memory_order_acquire); }

    // Creates the unique indexes the stores' conditional writes rely on.
    Result ensure_indexes();

    // Round trip to the server; the readiness check uses this rather than
    // the connected flag, which only reflects the last connect().
    Result ping();

    // RAII handle, wraps a pool::entry (defined in the .cpp).
    class ScopedClient {
    public:
        explicit ScopedClient(MongoClient& parent);
        ~ScopedClient();

        ScopedClient(ScopedClient&&) noexcept;
        ScopedClient& operator=(ScopedClient&&) = delete;
        ScopedClient(const ScopedClient&) = delete;
        ScopedClient& operator=(const ScopedClient&) = delete;

        bool valid() const { return valid_; }
        mongocxx::database database();
        mongocxx::collection collection(const std::string& name);

    private:
        struct Impl;
        MongoClient& parent_;
        std::unique_ptr<Impl> impl_;
        bool valid_ = false;
    };

    ScopedClient acquire();

    struct Stats {
        std::atomic<uint64_t> operations{0};
        std::atomic<uint64_t> errors{0};
        std::atomic<uint64_t> conflicts{0};
        std::atomic<uint64_t> latency_total_ms{0};
        std::atomic<uint64_t> latency_max_ms{0};
    };
    const Stats& stats() const { return stats_; }

    // Feeds the stats from the store operation's outcome.
    void record_operation(Result outcome, Millisecs latency);

    const Config& config() const { return config_; }

    MongoClient(const MongoClient&) = delete;
    MongoClient& operator=(const MongoClient&) = delete;

private:
    Config config_;
    std::unique_ptr<mongocxx::instance> instance_;
    std::unique_ptr<mongocxx::pool> pool_;
    std::atomic<bool> connected_{false};
    Stats stats_;
};

} // namespace turbo_dialer
#endif // MONGO_CLIENT_H

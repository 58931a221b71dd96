// =============================================================================
// FILE: src/persistence/mongo_client.cpp
// =============================================================================
#include "persistence/mongo_client.h"
#include "common/logger.h"

#include <mongocxx/instance.hpp>
#include <mongocxx/pool.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/uri.hpp>
#include <mongocxx/options/index.hpp>
#include <mongocxx/exception/exception.hpp>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>

namespace turbo_dialer {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

MongoClient::MongoClient(const Config& config) : config_(config) {}

MongoClient::~MongoClient() { disconnect(); }

Result MongoClient::connect() {
    try {
        instance_ = std::make_unique<mongocxx::instance>();

        std::string uri_str = config_.mongo_uri;
        if (uri_str.find("serverSelectionTimeoutMS") == std::string::npos) {
            auto scheme = uri_str.find("://");
            bool has_path = scheme != std::string::npos &&
                            uri_str.find('/', scheme + 3) != std::string::npos;
            if (uri_str.find('?') != std::string::npos) uri_str += "&";
            else uri_str += has_path ? "?" : "/?";
            uri_str += "serverSelectionTimeoutMS=" +
                       std::to_string(config_.mongo_connect_timeout.count());
        }

        mongocxx::uri uri{uri_str};
        pool_ = std::make_unique<mongocxx::pool>(uri);
        connected_.store(true);

        auto client = pool_->acquire();
        auto db = (*client)[config_.mongo_database];
        db.run_command(make_document(kvp("ping", 1)));

        LOG_INFO("MongoDB connected: %s/%s", config_.mongo_uri.c_str(), config_.mongo_database.c_str());
        return Result::kOk;

    } catch (const mongocxx::exception& e) {
        connected_.store(false);
        LOG_ERROR("MongoDB connect failed: %s", e.what());
        return Result::kPersistenceError;
    }
}

void MongoClient::disconnect() {
    connected_.store(false);
    pool_.reset();
    instance_.reset();
}

Result MongoClient::ensure_indexes() {
    auto client = acquire();
    if (!client.valid()) return Result::kConnectionLost;

    try {
        mongocxx::options::index unique;
        unique.unique(true);

        // One queue row per (org, lead); enqueue upserts on it
        client.collection(config_.mongo_collection_queue).create_index(
            make_document(kvp("org_id", 1), kvp("lead_id", 1)), unique);
        client.collection(config_.mongo_collection_queue).create_index(
            make_document(kvp("org_id", 1), kvp("status", 1),
                          kvp("priority", -1), kvp("added_at", 1)));

        client.collection(config_.mongo_collection_calls).create_index(
            make_document(kvp("batch_id", 1)));
        client.collection(config_.mongo_collection_calls).create_index(
            make_document(kvp("org_id", 1), kvp("status", 1)));

        // One session per rep per org
        client.collection(config_.mongo_collection_sessions).create_index(
            make_document(kvp("org_id", 1), kvp("rep_id", 1)), unique);
        client.collection(config_.mongo_collection_sessions).create_index(
            make_document(kvp("org_id", 1), kvp("availability", 1),
                          kvp("last_released_at", 1)));

        LOG_INFO("MongoDB indexes ensured on %s", config_.mongo_database.c_str());
        return Result::kOk;
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB create_index failed: %s", e.what());
        return Result::kPersistenceError;
    }
}

Result MongoClient::ping() {
    auto client = acquire();
    if (!client.valid()) return Result::kConnectionLost;
    try {
        client.database().run_command(make_document(kvp("ping", 1)));
        return Result::kOk;
    } catch (const mongocxx::exception& e) {
        LOG_WARN("MongoDB ping failed: %s", e.what());
        return Result::kPersistenceError;
    }
}

void MongoClient::record_operation(Result outcome, Millisecs latency) {
    stats_.operations.fetch_add(1, std::memory_order_relaxed);
    switch (outcome) {
        case Result::kOk:
        case Result::kNotFound:
        case Result::kAlreadyExists:
            break;
        case Result::kConflict:
        case Result::kNotAvailable:
            stats_.conflicts.fetch_add(1, std::memory_order_relaxed);
            break;
        default:
            stats_.errors.fetch_add(1, std::memory_order_relaxed);
            break;
    }

    auto ms = static_cast<uint64_t>(latency.count());
    stats_.latency_total_ms.fetch_add(ms, std::memory_order_relaxed);
    uint64_t prev = stats_.latency_max_ms.load(std::memory_order_relaxed);
    while (ms > prev && !stats_.latency_max_ms.compare_exchange_weak(prev, ms)) {}
}

// Pimpl for ScopedClient, pool::entry returns the client to the pool on destruction
struct MongoClient::ScopedClient::Impl {
    mongocxx::pool::entry entry;
    explicit Impl(mongocxx::pool::entry e) : entry(std::move(e)) {}
};

MongoClient::ScopedClient::ScopedClient(MongoClient& parent) : parent_(parent) {
    if (!parent_.pool_ || !parent_.is_connected()) return;
    try {
        impl_ = std::make_unique<Impl>(parent_.pool_->acquire());
        valid_ = true;
    } catch (const mongocxx::exception& e) {
        LOG_ERROR("MongoDB acquire client failed: %s", e.what());
        impl_.reset();
        valid_ = false;
    }
}

MongoClient::ScopedClient::~ScopedClient() = default;
MongoClient::ScopedClient::ScopedClient(ScopedClient&&) noexcept = default;

mongocxx::database MongoClient::ScopedClient::database() {
    return (*impl_->entry)[parent_.config_.mongo_database];
}

mongocxx::collection MongoClient::ScopedClient::collection(const std::string& name) {
    return database()[name];
}

MongoClient::ScopedClient MongoClient::acquire() {
    return ScopedClient(*this);
}

} // namespace turbo_dialer

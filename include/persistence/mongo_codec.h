// =============================================================================
// FILE: include/persistence/mongo_codec.h
// =============================================================================
#ifndef MONGO_CODEC_H
#define MONGO_CODEC_H

// Only the mongo_*.cpp files include this; it pulls in the driver headers.

#include "common/types.h"
#include "common/logger.h"
#include "model/queue_entry.h"
#include "model/call_attempt.h"
#include "model/rep_session.h"
#include "persistence/mongo_client.h"

#include <bsoncxx/document/view.hpp>
#include <bsoncxx/document/value.hpp>
#include <bsoncxx/exception/exception.hpp>
#include <mongocxx/exception/exception.hpp>
#include <string>
#include <vector>

namespace turbo_dialer {
namespace mongo_codec {

std::string get_string(bsoncxx::document::view doc, const char* key);
int64_t     get_int64(bsoncxx::document::view doc, const char* key);
bool        get_bool(bsoncxx::document::view doc, const char* key);

QueueEntry  decode_queue_entry(bsoncxx::document::view doc);
CallAttempt decode_call_attempt(bsoncxx::document::view doc);
RepSession  decode_rep_session(bsoncxx::document::view doc);

bsoncxx::document::value encode_call_attempt(const CallAttempt& attempt);
bsoncxx::document::value encode_rep_session(const RepSession& session);

// {"$set": {...}} for the fields a CallUpdate carries.
bsoncxx::document::value call_update_to_set(const CallUpdate& update);

// {"$in": [...]} over status names.
bsoncxx::document::value status_in(const std::vector<std::string>& statuses);

// Server error 11000 on insert or upsert.
bool is_duplicate_key(const mongocxx::exception& e);

} // namespace mongo_codec

// Runs one store primitive with a pooled client, converting driver
// exceptions into kPersistenceError and feeding the client's stats.
template <typename Fn>
Result run_mongo_op(MongoClient& mongo, const char* op, Fn&& fn) {
    ScopedTimer timer;
    auto client = mongo.acquire();
    if (!client.valid()) {
        mongo.record_operation(Result::kConnectionLost, timer.elapsed_ms());
        LOG_ERROR("MongoDB %s: no client available", op);
        return Result::kConnectionLost;
    }
    try {
        Result r = fn(client);
        mongo.record_operation(r, timer.elapsed_ms());
        return r;
    } catch (const mongocxx::exception& e) {
        mongo.record_operation(Result::kPersistenceError, timer.elapsed_ms());
        LOG_ERROR("MongoDB %s failed: %s", op, e.what());
        return Result::kPersistenceError;
    } catch (const bsoncxx::exception& e) {
        mongo.record_operation(Result::kPersistenceError, timer.elapsed_ms());
        LOG_ERROR("MongoDB %s: malformed document: %s", op, e.what());
        return Result::kPersistenceError;
    }
}

} // namespace turbo_dialer
#endif // MONGO_CODEC_H

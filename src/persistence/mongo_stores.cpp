// =============================================================================
// FILE: src/persistence/mongo_stores.cpp
// =============================================================================
#include "persistence/mongo_stores.h"
#include "persistence/mongo_client.h"
#include "persistence/mongo_codec.h"

#include <mongocxx/client.hpp>
#include <mongocxx/collection.hpp>
#include <mongocxx/database.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/options/find_one_and_update.hpp>
#include <mongocxx/options/update.hpp>
#include <mongocxx/exception/operation_exception.hpp>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <set>

namespace turbo_dialer {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;
using bsoncxx::builder::basic::sub_document;
using mongo_codec::status_in;
using Scoped = MongoClient::ScopedClient;

namespace {

int64_t i64(EpochMs v) { return static_cast<int64_t>(v); }

} // namespace

// =============================================================================
// MongoQueueStore
// =============================================================================

MongoQueueStore::MongoQueueStore(const Config& config, std::shared_ptr<MongoClient> mongo)
    : QueueStore(RetryPolicy{config.retry_limit, config.retry_cooldown})
    , mongo_(std::move(mongo))
    , collection_(config.mongo_collection_queue)
{}

Result MongoQueueStore::upsert_lead(const QueueEntry& c, UpsertKind& kind) {
    return run_mongo_op(*mongo_, "queue.upsert", [&](Scoped& client) {
        auto coll = client.collection(collection_);

        // Explicit re-enqueue of a finished lead starts it over
        auto requeued = coll.update_one(
            make_document(kvp("org_id", c.org_id), kvp("lead_id", c.lead_id),
                          kvp("status", status_in({"completed", "failed"}))),
            make_document(kvp("$set", [&c](sub_document sd) {
                sd.append(kvp("status", "queued"),
                          kvp("attempt_count", 0),
                          kvp("next_attempt_after", i64(0)),
                          kvp("priority", c.priority),
                          kvp("lead_phone", c.lead_phone),
                          kvp("added_at", i64(c.added_at)),
                          kvp("added_by", c.added_by));
                if (!c.lead_name.empty()) sd.append(kvp("lead_name", c.lead_name));
            })));
        if (requeued && requeued->modified_count() > 0) {
            kind = UpsertKind::kRequeued;
            return Result::kOk;
        }

        auto filter = make_document(kvp("org_id", c.org_id), kvp("lead_id", c.lead_id));
        auto update = make_document(
            kvp("$set", [&c](sub_document sd) {
                sd.append(kvp("priority", c.priority), kvp("lead_phone", c.lead_phone));
                if (!c.lead_name.empty()) sd.append(kvp("lead_name", c.lead_name));
            }),
            kvp("$setOnInsert", [&c](sub_document sd) {
                sd.append(kvp("_id", c.id),
                          kvp("status", "queued"),
                          kvp("added_at", i64(c.added_at)),
                          kvp("added_by", c.added_by),
                          kvp("attempt_count", 0),
                          kvp("last_attempt_at", i64(0)),
                          kvp("last_disposition", ""),
                          kvp("next_attempt_after", i64(0)));
                if (c.lead_name.empty()) sd.append(kvp("lead_name", ""));
            }));

        mongocxx::options::update opts;
        opts.upsert(true);
        try {
            auto res = coll.update_one(filter.view(), update.view(), opts);
            kind = (res && res->upserted_id()) ? UpsertKind::kInserted : UpsertKind::kRefreshed;
        } catch (const mongocxx::operation_exception& e) {
            if (!mongo_codec::is_duplicate_key(e)) throw;
            // A concurrent enqueue inserted the lead first; ours becomes a refresh
            coll.update_one(filter.view(), update.view(), opts);
            kind = UpsertKind::kRefreshed;
        }
        return Result::kOk;
    });
}

Result MongoQueueStore::next_batch(const OrgId& org_id, size_t n, std::vector<QueueEntry>& out) {
    return run_mongo_op(*mongo_, "queue.next_batch", [&](Scoped& client) {
        auto coll = client.collection(collection_);
        EpochMs now = now_epoch_ms();

        mongocxx::options::find_one_and_update opts;
        opts.sort(make_document(kvp("priority", -1), kvp("added_at", 1)));
        opts.return_document(mongocxx::options::return_document::k_after);

        auto filter = make_document(
            kvp("org_id", org_id), kvp("status", "queued"),
            kvp("next_attempt_after", make_document(kvp("$lte", i64(now)))));
        auto update = make_document(kvp("$set", make_document(
            kvp("status", "dialing"), kvp("last_attempt_at", i64(now)))));

        // One atomic claim per row: a concurrent cycle can never get the same entry
        for (size_t i = 0; i < n; ++i) {
            auto doc = coll.find_one_and_update(filter.view(), update.view(), opts);
            if (!doc) break;
            out.push_back(mongo_codec::decode_queue_entry(doc->view()));
        }
        return Result::kOk;
    });
}

Result MongoQueueStore::apply_outcome_if_unchanged(const QueueEntry& observed,
                                                   const OutcomeUpdate& u) {
    return run_mongo_op(*mongo_, "queue.mark_outcome", [&](Scoped& client) {
        auto res = client.collection(collection_).update_one(
            make_document(kvp("_id", observed.id),
                          kvp("status", queue_status_to_string(observed.status)),
                          kvp("attempt_count", observed.attempt_count)),
            make_document(kvp("$set", make_document(
                kvp("status", queue_status_to_string(u.status)),
                kvp("attempt_count", u.attempt_count),
                kvp("next_attempt_after", i64(u.next_attempt_after)),
                kvp("last_disposition", u.last_disposition)))));
        return (res && res->matched_count() > 0) ? Result::kOk : Result::kConflict;
    });
}

Result MongoQueueStore::advance(const std::string& entry_id, QueueStatus to) {
    std::vector<std::string> from;
    if (to == QueueStatus::kRinging) {
        from = {"dialing"};
    } else if (to == QueueStatus::kAnswered) {
        from = {"dialing", "ringing"};
    } else {
        return Result::kInvalidArgument;
    }

    return run_mongo_op(*mongo_, "queue.advance", [&](Scoped& client) {
        auto res = client.collection(collection_).update_one(
            make_document(kvp("_id", entry_id), kvp("status", status_in(from))),
            make_document(kvp("$set", make_document(
                kvp("status", queue_status_to_string(to))))));
        return (res && res->matched_count() > 0) ? Result::kOk : Result::kConflict;
    });
}

Result MongoQueueStore::requeue(const std::string& entry_id) {
    return run_mongo_op(*mongo_, "queue.requeue", [&](Scoped& client) {
        auto res = client.collection(collection_).update_one(
            make_document(kvp("_id", entry_id),
                          kvp("status", status_in({"dialing", "ringing", "answered"}))),
            make_document(kvp("$set", make_document(
                kvp("status", "queued"), kvp("last_disposition", "canceled")))));
        return (res && res->matched_count() > 0) ? Result::kOk : Result::kConflict;
    });
}

Result MongoQueueStore::get(const std::string& entry_id, QueueEntry& out) {
    return run_mongo_op(*mongo_, "queue.get", [&](Scoped& client) {
        auto doc = client.collection(collection_).find_one(make_document(kvp("_id", entry_id)));
        if (!doc) return Result::kNotFound;
        out = mongo_codec::decode_queue_entry(doc->view());
        return Result::kOk;
    });
}

Result MongoQueueStore::list(const OrgId& org_id, std::vector<QueueEntry>& out) {
    return run_mongo_op(*mongo_, "queue.list", [&](Scoped& client) {
        mongocxx::options::find opts;
        opts.sort(make_document(kvp("priority", -1), kvp("added_at", 1)));
        auto cursor = client.collection(collection_).find(
            make_document(kvp("org_id", org_id)), opts);
        for (auto&& doc : cursor) {
            out.push_back(mongo_codec::decode_queue_entry(doc));
        }
        return Result::kOk;
    });
}

Result MongoQueueStore::remove(const OrgId& org_id, const std::string& lead_id) {
    return run_mongo_op(*mongo_, "queue.remove", [&](Scoped& client) {
        auto res = client.collection(collection_).delete_one(
            make_document(kvp("org_id", org_id), kvp("lead_id", lead_id)));
        return (res && res->deleted_count() > 0) ? Result::kOk : Result::kNotFound;
    });
}

Result MongoQueueStore::clear_queued(const OrgId& org_id, size_t& removed) {
    return run_mongo_op(*mongo_, "queue.clear", [&](Scoped& client) {
        auto res = client.collection(collection_).delete_many(
            make_document(kvp("org_id", org_id), kvp("status", "queued")));
        removed = res ? static_cast<size_t>(res->deleted_count()) : 0;
        return Result::kOk;
    });
}

// =============================================================================
// MongoRepPool
// =============================================================================

MongoRepPool::MongoRepPool(const Config& config, std::shared_ptr<MongoClient> mongo)
    : mongo_(std::move(mongo))
    , collection_(config.mongo_collection_sessions)
{}

Result MongoRepPool::insert_session(const RepSession& session) {
    return run_mongo_op(*mongo_, "sessions.insert", [&](Scoped& client) {
        try {
            client.collection(collection_).insert_one(mongo_codec::encode_rep_session(session));
        } catch (const mongocxx::operation_exception& e) {
            if (mongo_codec::is_duplicate_key(e)) return Result::kAlreadyExists;
            throw;
        }
        return Result::kOk;
    });
}

Result MongoRepPool::list_available(const OrgId& org_id, std::vector<RepSession>& out) {
    return run_mongo_op(*mongo_, "sessions.list_available", [&](Scoped& client) {
        mongocxx::options::find opts;
        opts.sort(make_document(kvp("last_released_at", 1), kvp("started_at", 1)));
        auto cursor = client.collection(collection_).find(
            make_document(kvp("org_id", org_id), kvp("availability", "available")), opts);
        for (auto&& doc : cursor) {
            out.push_back(mongo_codec::decode_rep_session(doc));
        }
        return Result::kOk;
    });
}

Result MongoRepPool::try_claim(const std::string& session_id, const std::string& call_handle,
                               const std::string& conference_name, EpochMs now) {
    return run_mongo_op(*mongo_, "sessions.claim", [&](Scoped& client) {
        auto res = client.collection(collection_).update_one(
            make_document(kvp("_id", session_id), kvp("availability", "available")),
            make_document(kvp("$set", make_document(
                kvp("availability", "claimed"),
                kvp("conference_name", conference_name),
                kvp("claimed_call_handle", call_handle),
                kvp("claimed_at", i64(now))))));
        return (res && res->modified_count() > 0) ? Result::kOk : Result::kConflict;
    });
}

Result MongoRepPool::release_rep(const std::string& session_id,
                                 const std::string& expected_conference) {
    return run_mongo_op(*mongo_, "sessions.release", [&](Scoped& client) {
        bsoncxx::builder::basic::document f;
        f.append(kvp("_id", session_id), kvp("availability", "claimed"));
        if (!expected_conference.empty()) f.append(kvp("conference_name", expected_conference));

        auto res = client.collection(collection_).update_one(
            f.view(),
            make_document(kvp("$set", make_document(
                kvp("availability", "available"),
                kvp("conference_name", ""),
                kvp("claimed_call_handle", ""),
                kvp("claimed_at", i64(0)),
                kvp("last_released_at", i64(now_epoch_ms()))))));
        return (res && res->modified_count() > 0) ? Result::kOk : Result::kNotFound;
    });
}

Result MongoRepPool::bump_counter(const std::string& session_id, const char* field, int64_t n) {
    return run_mongo_op(*mongo_, "sessions.increment", [&](Scoped& client) {
        auto res = client.collection(collection_).update_one(
            make_document(kvp("_id", session_id)),
            make_document(kvp("$inc", make_document(kvp(field, n)))));
        return (res && res->matched_count() > 0) ? Result::kOk : Result::kNotFound;
    });
}

Result MongoRepPool::increment_connected(const std::string& session_id) {
    return bump_counter(session_id, "connected_call_count", 1);
}

Result MongoRepPool::increment_dialed(const std::string& session_id, uint64_t n) {
    return bump_counter(session_id, "calls_dialed", static_cast<int64_t>(n));
}

Result MongoRepPool::close_session(const std::string& session_id) {
    return run_mongo_op(*mongo_, "sessions.close", [&](Scoped& client) {
        auto res = client.collection(collection_).delete_one(make_document(kvp("_id", session_id)));
        return (res && res->deleted_count() > 0) ? Result::kOk : Result::kNotFound;
    });
}

Result MongoRepPool::get(const std::string& session_id, RepSession& out) {
    return run_mongo_op(*mongo_, "sessions.get", [&](Scoped& client) {
        auto doc = client.collection(collection_).find_one(make_document(kvp("_id", session_id)));
        if (!doc) return Result::kNotFound;
        out = mongo_codec::decode_rep_session(doc->view());
        return Result::kOk;
    });
}

Result MongoRepPool::find_by_rep(const OrgId& org_id, const std::string& rep_id, RepSession& out) {
    return run_mongo_op(*mongo_, "sessions.find_by_rep", [&](Scoped& client) {
        auto doc = client.collection(collection_).find_one(
            make_document(kvp("org_id", org_id), kvp("rep_id", rep_id)));
        if (!doc) return Result::kNotFound;
        out = mongo_codec::decode_rep_session(doc->view());
        return Result::kOk;
    });
}

Result MongoRepPool::list_by_org(const OrgId& org_id, std::vector<RepSession>& out) {
    return run_mongo_op(*mongo_, "sessions.list", [&](Scoped& client) {
        auto cursor = client.collection(collection_).find(make_document(kvp("org_id", org_id)));
        for (auto&& doc : cursor) {
            out.push_back(mongo_codec::decode_rep_session(doc));
        }
        return Result::kOk;
    });
}

Result MongoRepPool::count_available(const OrgId& org_id, size_t& out) {
    return run_mongo_op(*mongo_, "sessions.count_available", [&](Scoped& client) {
        out = static_cast<size_t>(client.collection(collection_).count_documents(
            make_document(kvp("org_id", org_id), kvp("availability", "available"))));
        return Result::kOk;
    });
}

Result MongoRepPool::active_orgs(std::vector<OrgId>& out) {
    return run_mongo_op(*mongo_, "sessions.active_orgs", [&](Scoped& client) {
        mongocxx::options::find opts;
        opts.projection(make_document(kvp("org_id", 1)));
        auto cursor = client.collection(collection_).find(
            make_document(kvp("availability", "available")), opts);
        std::set<OrgId> orgs;
        for (auto&& doc : cursor) {
            orgs.insert(mongo_codec::get_string(doc, "org_id"));
        }
        out.assign(orgs.begin(), orgs.end());
        return Result::kOk;
    });
}

Result MongoRepPool::list_stale_claims(EpochMs claimed_before, std::vector<RepSession>& out) {
    return run_mongo_op(*mongo_, "sessions.stale_claims", [&](Scoped& client) {
        auto cursor = client.collection(collection_).find(make_document(
            kvp("availability", "claimed"),
            kvp("claimed_at", make_document(kvp("$lt", i64(claimed_before))))));
        for (auto&& doc : cursor) {
            out.push_back(mongo_codec::decode_rep_session(doc));
        }
        return Result::kOk;
    });
}

// =============================================================================
// MongoCallAttemptStore
// =============================================================================

MongoCallAttemptStore::MongoCallAttemptStore(const Config& config,
                                             std::shared_ptr<MongoClient> mongo)
    : mongo_(std::move(mongo))
    , collection_(config.mongo_collection_calls)
    , batches_collection_(config.mongo_collection_batches)
{}

Result MongoCallAttemptStore::create(const CallAttempt& attempt) {
    return run_mongo_op(*mongo_, "calls.create", [&](Scoped& client) {
        try {
            client.collection(collection_).insert_one(mongo_codec::encode_call_attempt(attempt));
        } catch (const mongocxx::operation_exception& e) {
            if (mongo_codec::is_duplicate_key(e)) return Result::kAlreadyExists;
            throw;
        }
        return Result::kOk;
    });
}

Result MongoCallAttemptStore::get(const std::string& call_handle, CallAttempt& out) {
    return run_mongo_op(*mongo_, "calls.get", [&](Scoped& client) {
        auto doc = client.collection(collection_).find_one(make_document(kvp("_id", call_handle)));
        if (!doc) return Result::kNotFound;
        out = mongo_codec::decode_call_attempt(doc->view());
        return Result::kOk;
    });
}

Result MongoCallAttemptStore::transition(const std::string& call_handle, const CallUpdate& update,
                                         const std::vector<CallStatus>& only_from,
                                         CallAttempt* before) {
    std::vector<std::string> from;
    for (CallStatus s : allowed_predecessors(update.status, only_from)) {
        from.push_back(call_status_to_string(s));
    }

    return run_mongo_op(*mongo_, "calls.transition", [&](Scoped& client) {
        auto coll = client.collection(collection_);
        if (!from.empty()) {
            mongocxx::options::find_one_and_update opts;
            opts.return_document(mongocxx::options::return_document::k_before);
            auto doc = coll.find_one_and_update(
                make_document(kvp("_id", call_handle), kvp("status", status_in(from))),
                mongo_codec::call_update_to_set(update), opts);
            if (doc) {
                if (before) *before = mongo_codec::decode_call_attempt(doc->view());
                return Result::kOk;
            }
        }
        auto exists = coll.find_one(make_document(kvp("_id", call_handle)));
        return exists ? Result::kConflict : Result::kNotFound;
    });
}

Result MongoCallAttemptStore::list_batch(const std::string& batch_id, std::vector<CallAttempt>& out) {
    return run_mongo_op(*mongo_, "calls.list_batch", [&](Scoped& client) {
        auto cursor = client.collection(collection_).find(make_document(kvp("batch_id", batch_id)));
        for (auto&& doc : cursor) {
            out.push_back(mongo_codec::decode_call_attempt(doc));
        }
        return Result::kOk;
    });
}

Result MongoCallAttemptStore::list_active(const OrgId& org_id, std::vector<CallAttempt>& out) {
    return run_mongo_op(*mongo_, "calls.list_active", [&](Scoped& client) {
        auto cursor = client.collection(collection_).find(make_document(
            kvp("org_id", org_id),
            kvp("status", status_in({"dialing", "ringing", "answered",
                                     "holding", "connected", "voicemail"}))));
        for (auto&& doc : cursor) {
            out.push_back(mongo_codec::decode_call_attempt(doc));
        }
        return Result::kOk;
    });
}

Result MongoCallAttemptStore::attach_voicemail(const std::string& call_handle,
                                               const std::string& voicemail_url,
                                               const std::string& transcription) {
    if (voicemail_url.empty() && transcription.empty()) return Result::kOk;

    return run_mongo_op(*mongo_, "calls.attach_voicemail", [&](Scoped& client) {
        auto res = client.collection(collection_).update_one(
            make_document(kvp("_id", call_handle)),
            make_document(kvp("$set", [&](sub_document sd) {
                if (!voicemail_url.empty()) sd.append(kvp("voicemail_url", voicemail_url));
                if (!transcription.empty()) sd.append(kvp("voicemail_transcription", transcription));
            })));
        return (res && res->matched_count() > 0) ? Result::kOk : Result::kNotFound;
    });
}

Result MongoCallAttemptStore::claim_first_answer(const std::string& batch_id,
                                                 const std::string& call_handle, bool& won) {
    return run_mongo_op(*mongo_, "batches.first_answer", [&](Scoped& client) {
        auto coll = client.collection(batches_collection_);
        mongocxx::options::update opts;
        opts.upsert(true);
        try {
            auto res = coll.update_one(
                make_document(kvp("_id", batch_id)),
                make_document(kvp("$setOnInsert", make_document(
                    kvp("first_answer", call_handle),
                    kvp("answered_at", i64(now_epoch_ms()))))),
                opts);
            if (res && res->upserted_id()) {
                won = true;
                return Result::kOk;
            }
        } catch (const mongocxx::operation_exception& e) {
            if (!mongo_codec::is_duplicate_key(e)) throw;
        }
        auto doc = coll.find_one(make_document(kvp("_id", batch_id)));
        won = doc && mongo_codec::get_string(doc->view(), "first_answer") == call_handle;
        return Result::kOk;
    });
}

} // namespace turbo_dialer

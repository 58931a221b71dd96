// =============================================================================
// FILE: src/http/turbo_api_handler.cpp
// =============================================================================
#include "http/turbo_api_handler.h"
#include "persistence/queue_store.h"
#include "persistence/rep_pool.h"
#include "persistence/call_attempt_store.h"
#include "dialer/dispatch_launcher.h"
#include "dialer/rep_connector.h"
#include "common/logger.h"

#include <nlohmann/json.hpp>
#include <map>
#include <vector>

namespace turbo_dialer {

namespace {

using nlohmann::json;

HttpServer::Response json_response(int status, const json& body) {
    HttpServer::Response resp;
    resp.status_code = status;
    resp.body = body.dump();
    return resp;
}

HttpServer::Response error_response(int status, const std::string& message) {
    return json_response(status, json{{"error", message}});
}

int status_for(Result r) {
    switch (r) {
        case Result::kOk:              return 200;
        case Result::kNotFound:        return 404;
        case Result::kInvalidArgument: return 400;
        case Result::kConflict:        return 409;
        case Result::kAlreadyExists:   return 409;
        default:                       return 500;
    }
}

// Body must be a JSON object; returns false and fills `resp` otherwise.
bool parse_body(const HttpServer::Request& req, json& body, HttpServer::Response& resp) {
    try {
        body = json::parse(req.body);
    } catch (const json::exception& e) {
        LOG_WARN("API: %s %s invalid JSON: %s", req.method.c_str(), req.path.c_str(), e.what());
        resp = error_response(400, "invalid request body");
        return false;
    }
    if (!body.is_object()) {
        resp = error_response(400, "request body must be an object");
        return false;
    }
    return true;
}

std::string string_field(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

json entry_to_json(const QueueEntry& e) {
    return json{
        {"id", e.id},
        {"lead_id", e.lead_id},
        {"lead_phone", e.lead_phone},
        {"lead_name", e.lead_name},
        {"priority", e.priority},
        {"status", queue_status_to_string(e.status)},
        {"added_at", e.added_at},
        {"added_by", e.added_by},
        {"attempt_count", e.attempt_count},
        {"last_attempt_at", e.last_attempt_at},
        {"last_disposition", e.last_disposition},
        {"next_attempt_after", e.next_attempt_after},
    };
}

json session_to_json(const RepSession& s) {
    json j{
        {"session_id", s.session_id},
        {"rep_id", s.rep_id},
        {"org_id", s.org_id},
        {"availability", availability_to_string(s.availability)},
        {"started_at", s.started_at},
        {"last_released_at", s.last_released_at},
        {"calls_dialed", s.calls_dialed},
        {"connected_call_count", s.connected_call_count},
    };
    if (s.availability == RepAvailability::kClaimed) {
        j["conference_name"] = s.conference_name;
        j["claimed_call_handle"] = s.claimed_call_handle;
        j["claimed_at"] = s.claimed_at;
    }
    return j;
}

json call_to_json(const CallAttempt& c) {
    return json{
        {"call_handle", c.call_handle},
        {"lead_id", c.lead_id},
        {"batch_id", c.batch_id},
        {"status", call_status_to_string(c.status)},
        {"to_number", c.to_number},
        {"caller_id", c.caller_id},
        {"assigned_rep_id", c.assigned_rep_id},
        {"is_first_answer", c.is_first_answer},
        {"created_at", c.created_at},
    };
}

} // namespace

void TurboApiHandler::register_routes(HttpServer& server, const Dependencies& deps) {
    auto d = deps;

    server.route("POST", "/turbo/queue",
                 [d](const HttpServer::Request& r) { return handle_enqueue(r, d); });
    server.route("GET", "/turbo/queue",
                 [d](const HttpServer::Request& r) { return handle_get_queue(r, d); });
    server.route("DELETE", "/turbo/queue",
                 [d](const HttpServer::Request& r) { return handle_delete_queue(r, d); });
    server.route("POST", "/turbo/session/start",
                 [d](const HttpServer::Request& r) { return handle_session_start(r, d); });
    server.route("POST", "/turbo/session/stop",
                 [d](const HttpServer::Request& r) { return handle_session_stop(r, d); });
    server.route("POST", "/turbo/dial",
                 [d](const HttpServer::Request& r) { return handle_dial(r, d); });
}

HttpServer::Response TurboApiHandler::handle_enqueue(const HttpServer::Request& req,
                                                     const Dependencies& d) {
    HttpServer::Response resp;
    json body;
    if (!parse_body(req, body, resp)) return resp;
    if (!d.queue) return error_response(503, "queue unavailable");

    std::string org_id = string_field(body, "org_id");
    if (org_id.empty()) return error_response(400, "org_id is required");

    auto leads_it = body.find("leads");
    if (leads_it == body.end() || !leads_it->is_array()) {
        return error_response(400, "leads must be an array");
    }

    int priority = 0;
    auto prio_it = body.find("priority");
    if (prio_it != body.end()) {
        if (!prio_it->is_number_integer()) return error_response(400, "priority must be an integer");
        priority = prio_it->get<int>();
    }

    std::vector<LeadRef> leads;
    leads.reserve(leads_it->size());
    for (const auto& item : *leads_it) {
        if (!item.is_object()) return error_response(400, "each lead must be an object");
        LeadRef lead;
        lead.lead_id = string_field(item, "lead_id");
        lead.phone   = string_field(item, "phone");
        lead.name    = string_field(item, "name");
        leads.push_back(std::move(lead));
    }

    QueueStore::EnqueueSummary summary;
    Result r = d.queue->enqueue(org_id, leads, priority, string_field(body, "added_by"), summary);
    json out{
        {"org_id", org_id},
        {"inserted", summary.inserted},
        {"refreshed", summary.refreshed},
        {"requeued", summary.requeued},
        {"rejected", summary.rejected},
    };
    if (r != Result::kOk) {
        out["error"] = result_to_string(r);
        return json_response(status_for(r), out);
    }
    return json_response(200, out);
}

HttpServer::Response TurboApiHandler::handle_get_queue(const HttpServer::Request& req,
                                                       const Dependencies& d) {
    std::string org_id = req.query("org_id");
    if (org_id.empty()) return error_response(400, "org_id is required");
    if (!d.queue || !d.reps || !d.calls) return error_response(503, "stores unavailable");

    std::vector<QueueEntry> entries;
    Result r = d.queue->list(org_id, entries);
    if (r != Result::kOk) return error_response(status_for(r), result_to_string(r));

    std::map<std::string, size_t> counts;
    for (const auto& e : entries) counts[queue_status_to_string(e.status)]++;

    std::vector<RepSession> sessions;
    r = d.reps->list_by_org(org_id, sessions);
    if (r != Result::kOk) return error_response(status_for(r), result_to_string(r));

    std::vector<CallAttempt> active;
    r = d.calls->list_active(org_id, active);
    if (r != Result::kOk) return error_response(status_for(r), result_to_string(r));

    json out{{"org_id", org_id}};
    out["counts"] = counts;
    out["entries"] = json::array();
    for (const auto& e : entries) out["entries"].push_back(entry_to_json(e));
    out["sessions"] = json::array();
    for (const auto& s : sessions) out["sessions"].push_back(session_to_json(s));
    out["active_calls"] = json::array();
    for (const auto& c : active) out["active_calls"].push_back(call_to_json(c));
    return json_response(200, out);
}

HttpServer::Response TurboApiHandler::handle_delete_queue(const HttpServer::Request& req,
                                                          const Dependencies& d) {
    std::string org_id = req.query("org_id");
    if (org_id.empty()) return error_response(400, "org_id is required");
    if (!d.queue) return error_response(503, "queue unavailable");

    if (req.query("clear_all") == "true") {
        size_t removed = 0;
        Result r = d.queue->clear_queued(org_id, removed);
        if (r != Result::kOk) return error_response(status_for(r), result_to_string(r));
        LOG_INFO("API: org=%s cleared %zu queued entries", org_id.c_str(), removed);
        return json_response(200, json{{"org_id", org_id}, {"removed", removed}});
    }

    std::string lead_id = req.query("lead_id");
    if (lead_id.empty()) return error_response(400, "lead_id or clear_all=true is required");

    Result r = d.queue->remove(org_id, lead_id);
    if (r != Result::kOk) return error_response(status_for(r), result_to_string(r));
    return json_response(200, json{{"org_id", org_id}, {"lead_id", lead_id}, {"removed", 1}});
}

HttpServer::Response TurboApiHandler::handle_session_start(const HttpServer::Request& req,
                                                           const Dependencies& d) {
    HttpServer::Response resp;
    json body;
    if (!parse_body(req, body, resp)) return resp;
    if (!d.reps) return error_response(503, "rep pool unavailable");

    std::string org_id = string_field(body, "org_id");
    std::string rep_id = string_field(body, "rep_id");
    if (org_id.empty() || rep_id.empty()) return error_response(400, "org_id and rep_id are required");

    RepSession session;
    Result r = d.reps->open_session(org_id, rep_id, session);
    if (r != Result::kOk) return error_response(status_for(r), result_to_string(r));

    json out = session_to_json(session);
    if (d.connector) out["join_url"] = d.connector->join_url(session.session_id);
    return json_response(200, out);
}

HttpServer::Response TurboApiHandler::handle_session_stop(const HttpServer::Request& req,
                                                          const Dependencies& d) {
    HttpServer::Response resp;
    json body;
    if (!parse_body(req, body, resp)) return resp;
    if (!d.reps) return error_response(503, "rep pool unavailable");

    std::string session_id = string_field(body, "session_id");
    if (session_id.empty()) return error_response(400, "session_id is required");

    Result r = d.reps->release_rep(session_id);
    if (r != Result::kOk && r != Result::kNotFound) {
        LOG_WARN("API: release before closing session=%s failed: %s",
                 session_id.c_str(), result_to_string(r));
    }

    r = d.reps->close_session(session_id);
    if (r == Result::kNotFound) return error_response(404, "session not found");
    if (r != Result::kOk) return error_response(status_for(r), result_to_string(r));

    LOG_INFO("API: session=%s stopped", session_id.c_str());
    return json_response(200, json{{"session_id", session_id}, {"stopped", true}});
}

HttpServer::Response TurboApiHandler::handle_dial(const HttpServer::Request& req,
                                                  const Dependencies& d) {
    std::string org_id = req.query("org_id");
    if (org_id.empty()) return error_response(400, "org_id is required");
    if (!d.launcher) return error_response(503, "launcher unavailable");

    DispatchReport report;
    Result r = d.launcher->run_dispatch_cycle(org_id, report);
    json out{
        {"org_id", org_id},
        {"batch_id", report.batch_id},
        {"available_reps", report.available_reps},
        {"in_flight", report.in_flight},
        {"requested", report.requested},
        {"dialed", report.dialed},
        {"failed", report.failed},
        {"call_handles", report.call_handles},
    };
    if (r != Result::kOk) {
        out["error"] = result_to_string(r);
        return json_response(status_for(r), out);
    }
    return json_response(200, out);
}

} // namespace turbo_dialer

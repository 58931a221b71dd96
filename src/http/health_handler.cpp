// =============================================================================
// FILE: src/http/health_handler.cpp
// =============================================================================
#include "http/health_handler.h"
#include "persistence/mongo_client.h"
#include "persistence/rep_pool.h"
#include "dispatch/dispatch_scheduler.h"
#include "dispatch/stale_claim_reaper.h"
#include "common/logger.h"
#include <sstream>
#include <vector>

namespace turbo_dialer {

namespace {

const char* json_bool(bool b) { return b ? "true" : "false"; }

// Reads the orgs that currently have a free rep; doubles as a store check.
bool check_rep_pool(RepPool* reps, size_t& dialing_orgs) {
    dialing_orgs = 0;
    if (!reps) return false;
    std::vector<OrgId> orgs;
    Result r = reps->active_orgs(orgs);
    if (r != Result::kOk) {
        LOG_WARN("Health: rep pool check failed: %s", result_to_string(r));
        return false;
    }
    dialing_orgs = orgs.size();
    return true;
}

} // namespace

void HealthHandler::register_routes(HttpServer& server, const Dependencies& deps) {
    auto d = deps;
    server.route("GET", "/health", [d](const HttpServer::Request& r) { return handle_health(r, d); });
    server.route("GET", "/ready",  [d](const HttpServer::Request& r) { return handle_ready(r, d); });
}

HttpServer::Response HealthHandler::handle_health(const HttpServer::Request&,
                                                  const Dependencies& deps) {
    size_t dialing_orgs = 0;
    bool rep_pool_ok = check_rep_pool(deps.reps, dialing_orgs);

    std::ostringstream json;
    json << "{\"store\":\"" << (deps.mongo_enabled ? "mongodb" : "memory") << "\""
         << ",\"rep_pool\":" << json_bool(rep_pool_ok)
         << ",\"dialing_orgs\":" << dialing_orgs
         << ",\"telephony\":" << json_bool(deps.telephony_ready)
         << ",\"auto_dispatch\":" << json_bool(deps.scheduler != nullptr);
    if (deps.scheduler) {
        const auto& ss = deps.scheduler->stats();
        json << ",\"dispatch_sweeps\":" << ss.sweeps.load()
             << ",\"org_cycles\":" << ss.org_cycles.load();
    }
    if (deps.reaper) {
        json << ",\"reaper_scans\":" << deps.reaper->stats().scan_count.load();
    }
    json << ",\"healthy\":" << json_bool(rep_pool_ok)
         << ",\"degraded\":" << json_bool(!deps.telephony_ready)
         << "}";

    HttpServer::Response resp;
    resp.status_code = rep_pool_ok ? 200 : 503;
    resp.body = json.str();
    return resp;
}

HttpServer::Response HealthHandler::handle_ready(const HttpServer::Request&,
                                                 const Dependencies& deps) {
    const char* blocker = nullptr;
    if (deps.mongo_enabled && !(deps.mongo && deps.mongo->ping() == Result::kOk)) {
        blocker = "mongodb";
    } else {
        size_t ignored = 0;
        if (!check_rep_pool(deps.reps, ignored)) blocker = "rep_pool";
    }

    HttpServer::Response resp;
    resp.status_code = blocker ? 503 : 200;
    resp.body = blocker ? std::string(R"({"ready":false,"waiting_on":")") + blocker + "\"}"
                        : std::string(R"({"ready":true})");
    return resp;
}

} // namespace turbo_dialer

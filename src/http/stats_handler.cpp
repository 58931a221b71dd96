// =============================================================================
// FILE: src/http/stats_handler.cpp
// =============================================================================
#include "http/stats_handler.h"
#include "dialer/dispatch_launcher.h"
#include "dialer/answer_handler.h"
#include "dialer/lifecycle_processor.h"
#include "dialer/voicemail_finisher.h"
#include "dialer/rep_connector.h"
#include "dispatch/dispatch_scheduler.h"
#include "dispatch/stale_claim_reaper.h"
#include "telephony/twilio_provider.h"
#include "crm/http_crm_gateway.h"
#include "persistence/mongo_client.h"
#include "common/slow_handler_logger.h"
#include "common/config.h"
#include <sstream>

namespace turbo_dialer {

namespace {

// Only the tail of a secret is shown, enough to tell two credentials apart.
std::string redact(const std::string& secret) {
    if (secret.empty()) return "";
    if (secret.size() <= 4) return "***";
    return "***" + secret.substr(secret.size() - 4);
}

} // namespace

void StatsHandler::register_routes(HttpServer& server, const Dependencies& deps) {
    auto d = deps;

    server.route("GET", "/stats", [d](const HttpServer::Request& r) { return handle_stats(r, d); });
    server.route("GET", "/config", [d](const HttpServer::Request& r) { return handle_config(r, d); });
}

HttpServer::Response StatsHandler::handle_stats(const HttpServer::Request&, const Dependencies& d) {
    HttpServer::Response resp;
    std::ostringstream j;
    j << "{";
    j << "\"service\":\"turbo_dialer\"";

    if (d.launcher) {
        auto& s = d.launcher->stats();
        j << ",\"dispatch\":{";
        j << "\"cycles\":" << s.cycles.load();
        j << ",\"empty_cycles\":" << s.empty_cycles.load();
        j << ",\"saturated_cycles\":" << s.saturated_cycles.load();
        j << ",\"calls_placed\":" << s.calls_placed.load();
        j << ",\"calls_failed\":" << s.calls_failed.load();
        j << "}";
    }

    if (d.answer) {
        auto& s = d.answer->stats();
        j << ",\"answers\":{";
        j << "\"total\":" << s.answers.load();
        j << ",\"connected\":" << s.connected.load();
        j << ",\"holds\":" << s.holds.load();
        j << ",\"voicemails\":" << s.voicemails.load();
        j << ",\"machines\":" << s.machines.load();
        j << ",\"duplicates\":" << s.duplicates.load();
        j << ",\"races_lost\":" << s.races_lost.load();
        j << ",\"siblings_canceled\":" << s.siblings_canceled.load();
        j << ",\"rep_legs_failed\":" << s.rep_legs_failed.load();
        j << ",\"untracked\":" << s.untracked.load();
        j << "}";
    }

    if (d.connector) {
        auto& s = d.connector->stats();
        j << ",\"rep_legs\":{";
        j << "\"dialed\":" << s.legs_dialed.load();
        j << ",\"failed\":" << s.legs_failed.load();
        j << ",\"joins_served\":" << s.joins_served.load();
        j << ",\"joins_refused\":" << s.joins_refused.load();
        j << ",\"ended\":" << s.legs_ended.load();
        j << ",\"claims_released\":" << s.claims_released.load();
        j << "}";
    }

    if (d.lifecycle) {
        auto& s = d.lifecycle->stats();
        j << ",\"lifecycle\":{";
        j << "\"status_events\":" << s.status_events.load();
        j << ",\"conference_events\":" << s.conference_events.load();
        j << ",\"terminal_applied\":" << s.terminal_applied.load();
        j << ",\"replays\":" << s.replays.load();
        j << ",\"untracked\":" << s.untracked.load();
        j << ",\"reps_released\":" << s.reps_released.load();
        j << ",\"conferences_ended\":" << s.conferences_ended.load();
        j << "}";
    }

    if (d.voicemail) {
        auto& s = d.voicemail->stats();
        j << ",\"voicemail\":{";
        j << "\"recordings\":" << s.recordings.load();
        j << ",\"transcriptions\":" << s.transcriptions.load();
        j << ",\"transcriptions_skipped\":" << s.transcriptions_skipped.load();
        j << ",\"untracked\":" << s.untracked.load();
        j << "}";
    }

    if (d.scheduler) {
        auto& s = d.scheduler->stats();
        j << ",\"scheduler\":{";
        j << "\"sweeps\":" << s.sweeps.load();
        j << ",\"org_cycles\":" << s.org_cycles.load();
        j << ",\"cycle_errors\":" << s.cycle_errors.load();
        j << ",\"calls_placed\":" << s.calls_placed.load();
        j << "}";
    }

    // Reaper
    if (d.reaper) {
        auto& rs = d.reaper->stats();
        j << ",\"reaper\":{";
        j << "\"scans\":" << rs.scan_count.load();
        j << ",\"claims_released\":" << rs.claims_released.load();
        j << ",\"claims_kept\":" << rs.claims_kept.load();
        j << ",\"last_scan_stale\":" << rs.last_scan_stale_count.load();
        j << ",\"last_scan_ms\":" << rs.last_scan_duration_ms.load();
        j << "}";
    }

    if (d.provider) {
        auto& ps = d.provider->stats();
        j << ",\"telephony\":{";
        j << "\"calls_placed\":" << ps.calls_placed.load();
        j << ",\"calls_rejected\":" << ps.calls_rejected.load();
        j << ",\"cancels_sent\":" << ps.cancels_sent.load();
        j << ",\"cancels_failed\":" << ps.cancels_failed.load();
        j << "}";
    }

    if (d.crm) {
        auto& cs = d.crm->stats();
        j << ",\"crm\":{";
        j << "\"requests\":" << cs.requests.load();
        j << ",\"failures\":" << cs.failures.load();
        j << "}";
    }

    // Slow handlers
    if (d.slow_logger) {
        auto& ss = d.slow_logger->stats();
        auto th = d.slow_logger->thresholds();
        j << ",\"slow_handlers\":{";
        j << "\"timed\":" << ss.timed_count.load();
        j << ",\"warn_count\":" << ss.warn_count.load();
        j << ",\"error_count\":" << ss.error_count.load();
        j << ",\"critical_count\":" << ss.critical_count.load();
        j << ",\"max_duration_ms\":" << ss.max_duration_ms.load();
        j << ",\"warn_threshold_ms\":" << th.warn.count();
        j << ",\"error_threshold_ms\":" << th.error.count();
        j << ",\"critical_threshold_ms\":" << th.critical.count();
        j << "}";
    }

    // MongoDB
    if (d.mongo) {
        auto& ms = d.mongo->stats();
        j << ",\"mongodb\":{";
        j << "\"connected\":" << (d.mongo->is_connected() ? "true" : "false");
        j << ",\"operations\":" << ms.operations.load();
        j << ",\"errors\":" << ms.errors.load();
        j << ",\"conflicts\":" << ms.conflicts.load();
        j << ",\"latency_total_ms\":" << ms.latency_total_ms.load();
        j << ",\"latency_max_ms\":" << ms.latency_max_ms.load();
        j << "}";
    }

    if (d.http) {
        auto& hs = d.http->stats();
        j << ",\"http\":{";
        j << "\"requests_total\":" << hs.requests_total.load();
        j << ",\"requests_ok\":" << hs.requests_ok.load();
        j << ",\"requests_error\":" << hs.requests_error.load();
        j << ",\"requests_rejected\":" << hs.requests_rejected.load();
        j << ",\"active_connections\":" << hs.active_connections.load();
        j << ",\"pending_connections\":" << hs.pending_connections.load();
        j << "}";
    }

    j << "}";
    resp.body = j.str();
    return resp;
}

HttpServer::Response StatsHandler::handle_config(const HttpServer::Request&,
                                                 const Dependencies& d) {
    HttpServer::Response resp;
    if (!d.config) { resp.status_code = 500; return resp; }
    auto& c = *d.config;

    std::ostringstream j;
    j << "{";
    j << "\"service_id\":\"" << c.service_id << "\"";
    j << ",\"leads_per_rep\":" << c.leads_per_rep;
    j << ",\"max_batch_size\":" << c.max_batch_size;
    j << ",\"retry_limit\":" << c.retry_limit;
    j << ",\"retry_cooldown_sec\":" << c.retry_cooldown.count();
    j << ",\"ring_timeout_sec\":" << c.ring_timeout.count();
    j << ",\"machine_detection_timeout_sec\":" << c.machine_detection_timeout.count();
    j << ",\"hold_pause_sec\":" << c.hold_pause.count();
    j << ",\"voicemail_max_length_sec\":" << c.voicemail_max_length.count();
    j << ",\"auto_dispatch\":" << (c.auto_dispatch ? "true" : "false");
    j << ",\"dispatch_interval_sec\":" << c.dispatch_interval.count();
    j << ",\"stale_claim_timeout_sec\":" << c.stale_claim_timeout.count();
    j << ",\"telephony_api_base_url\":\"" << c.telephony_api_base_url << "\"";
    j << ",\"telephony_account_sid\":\"" << redact(c.telephony_account_sid) << "\"";
    j << ",\"telephony_auth_token\":\"" << (c.telephony_auth_token.empty() ? "" : "***redacted***") << "\"";
    j << ",\"public_base_url\":\"" << c.public_base_url << "\"";
    j << ",\"default_caller_id\":\"" << c.default_caller_id << "\"";
    j << ",\"caller_id_pool_size\":" << c.caller_id_pool.size();
    j << ",\"rep_endpoint\":\"" << c.rep_endpoint << "\"";
    j << ",\"rep_ring_timeout_sec\":" << c.rep_ring_timeout.count();
    j << ",\"crm_enabled\":" << (c.crm_enabled ? "true" : "false");
    j << ",\"crm_base_url\":\"" << c.crm_base_url << "\"";
    j << ",\"crm_api_token\":\"" << (c.crm_api_token.empty() ? "" : "***redacted***") << "\"";
    j << ",\"mongo_enabled\":" << (c.mongo_enable_persistence ? "true" : "false");
    j << ",\"mongo_uri\":\"" << "***redacted***" << "\"";
    j << ",\"mongo_database\":\"" << c.mongo_database << "\"";
    j << ",\"http_worker_threads\":" << c.http_worker_threads;
    j << ",\"slow_handler_warn_ms\":" << c.slow_handler_warn_threshold.count();
    j << ",\"slow_handler_error_ms\":" << c.slow_handler_error_threshold.count();
    j << ",\"slow_handler_critical_ms\":" << c.slow_handler_critical_threshold.count();
    j << "}";

    resp.body = j.str();
    return resp;
}

} // namespace turbo_dialer

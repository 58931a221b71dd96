// =============================================================================
// FILE: src/crm/http_crm_gateway.cpp
// =============================================================================
#include "crm/http_crm_gateway.h"
#include "common/logger.h"

#include <nlohmann/json.hpp>

namespace turbo_dialer {

HttpCrmGateway::HttpCrmGateway(const Config& config)
    : enabled_(config.crm_enabled)
{
    if (!enabled_) return;
    rest_ = std::make_unique<RestClient>(config.crm_base_url, config.crm_request_timeout);
    if (!config.crm_api_token.empty()) rest_->set_bearer_token(config.crm_api_token);
}

Result HttpCrmGateway::send(const char* op, const std::string& method,
                            const std::string& path, const std::string& body) {
    if (!enabled_) {
        LOG_DEBUG("CRM disabled, skipping %s %s", op, path.c_str());
        return Result::kOk;
    }
    stats_.requests.fetch_add(1, std::memory_order_relaxed);

    RestClient::Response resp;
    Result r = method == "PATCH" ? rest_->patch_json(path, body, resp)
                                 : rest_->post_json(path, body, resp);
    if (r != Result::kOk) {
        stats_.failures.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("CRM %s failed: %s", op, result_to_string(r));
        return r;
    }
    if (!is_http_success(resp.status)) {
        stats_.failures.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("CRM %s rejected: HTTP %d %s", op, resp.status, resp.body.substr(0, 200).c_str());
        return Result::kError;
    }
    return Result::kOk;
}

Result HttpCrmGateway::assign_lead_owner(const OrgId& org_id, const std::string& lead_id,
                                         const std::string& rep_id) {
    nlohmann::json body = {
        {"org_id", org_id},
        {"rep_id", rep_id},
        {"status", "contacted"},
        {"assigned_at", now_epoch_ms()},
    };
    return send("assign_lead_owner", "POST", "/turbo/leads/" + lead_id + "/owner", body.dump());
}

Result HttpCrmGateway::create_call_record(const CallAttempt& a) {
    nlohmann::json body = {
        {"call_handle", a.call_handle},
        {"org_id", a.org_id},
        {"lead_id", a.lead_id},
        {"rep_id", a.assigned_rep_id},
        {"direction", "outbound"},
        {"from_number", a.caller_id},
        {"to_number", a.to_number},
        {"conference_name", a.conference_name},
        {"started_at", a.connected_at ? a.connected_at : now_epoch_ms()},
        {"turbo_mode", true},
    };
    return send("create_call_record", "POST", "/turbo/calls", body.dump());
}

Result HttpCrmGateway::complete_call_record(const CallAttempt& a) {
    nlohmann::json body = {
        {"status", call_status_to_string(a.status)},
        {"duration_sec", a.duration_sec},
        {"ended_at", a.ended_at},
    };
    if (!a.recording_url.empty()) body["recording_url"] = a.recording_url;
    if (!a.voicemail_url.empty()) body["voicemail_url"] = a.voicemail_url;
    if (!a.voicemail_transcription.empty()) {
        body["voicemail_transcription"] = a.voicemail_transcription;
    }
    return send("complete_call_record", "PATCH", "/turbo/calls/" + a.call_handle, body.dump());
}

} // namespace turbo_dialer

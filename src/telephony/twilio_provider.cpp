// =============================================================================
// FILE: src/telephony/twilio_provider.cpp
// =============================================================================
#include "telephony/twilio_provider.h"
#include "common/logger.h"

#include <nlohmann/json.hpp>

namespace turbo_dialer {

namespace {

// Provider error bodies look like {"code":21211,"message":"..."}
std::string error_message(const RestClient::Response& resp) {
    try {
        auto j = nlohmann::json::parse(resp.body);
        if (j.is_object() && j.contains("message") && j["message"].is_string()) {
            return j["message"].get<std::string>();
        }
    } catch (const nlohmann::json::exception&) {
        // not JSON, fall through to the raw body
    }
    return resp.body.substr(0, 200);
}

} // namespace

TwilioProvider::TwilioProvider(const Config& config)
    : account_sid_(config.telephony_account_sid)
    , rest_(config.telephony_api_base_url, config.telephony_request_timeout)
{
    rest_.set_basic_auth(config.telephony_account_sid, config.telephony_auth_token);
}

std::string TwilioProvider::calls_path() const {
    return "/2010-04-01/Accounts/" + account_sid_ + "/Calls";
}

Result TwilioProvider::place_call(const PlaceCallRequest& req, std::string& call_handle) {
    RestClient::FormFields fields = {
        {"To", req.to},
        {"From", req.from},
        {"Url", req.answer_url},
        {"Method", "POST"},
        {"StatusCallback", req.status_callback_url},
        {"StatusCallbackMethod", "POST"},
        {"StatusCallbackEvent", "initiated"},
        {"StatusCallbackEvent", "ringing"},
        {"StatusCallbackEvent", "answered"},
        {"StatusCallbackEvent", "completed"},
        {"Timeout", std::to_string(req.ring_timeout.count())},
    };
    if (req.detect_machine) {
        fields.emplace_back("MachineDetection", "DetectMessageEnd");
        fields.emplace_back("MachineDetectionTimeout",
                            std::to_string(req.machine_detection_timeout.count()));
        fields.emplace_back("AsyncAmd", "false");
    }

    RestClient::Response resp;
    Result r = rest_.post_form(calls_path() + ".json", fields, resp);
    if (r != Result::kOk) {
        stats_.calls_rejected.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Provider unreachable placing call to %s: %s", req.to.c_str(), result_to_string(r));
        return Result::kProviderError;
    }
    if (!is_http_success(resp.status)) {
        stats_.calls_rejected.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Provider rejected call to %s: HTTP %d %s",
                 req.to.c_str(), resp.status, error_message(resp).c_str());
        return Result::kProviderError;
    }

    try {
        auto j = nlohmann::json::parse(resp.body);
        call_handle = j.value("sid", "");
    } catch (const nlohmann::json::exception& e) {
        stats_.calls_rejected.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("Provider reply for %s unreadable: %s", req.to.c_str(), e.what());
        return Result::kProviderError;
    }
    if (call_handle.empty()) {
        stats_.calls_rejected.fetch_add(1, std::memory_order_relaxed);
        LOG_ERROR("Provider reply for %s carries no call sid", req.to.c_str());
        return Result::kProviderError;
    }

    stats_.calls_placed.fetch_add(1, std::memory_order_relaxed);
    LOG_DEBUG("Placed call %s to %s from %s", call_handle.c_str(), req.to.c_str(), req.from.c_str());
    return Result::kOk;
}

Result TwilioProvider::cancel_call(const std::string& call_handle) {
    stats_.cancels_sent.fetch_add(1, std::memory_order_relaxed);

    RestClient::Response resp;
    Result r = rest_.post_form(calls_path() + "/" + call_handle + ".json",
                               {{"Status", "canceled"}}, resp);
    if (r != Result::kOk || !is_http_success(resp.status)) {
        stats_.cancels_failed.fetch_add(1, std::memory_order_relaxed);
        LOG_INFO("Cancel of %s not applied: %s", call_handle.c_str(),
                 r != Result::kOk ? result_to_string(r) : error_message(resp).c_str());
        return Result::kProviderError;
    }
    return Result::kOk;
}

} // namespace turbo_dialer

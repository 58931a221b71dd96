// =============================================================================
// FILE: src/dialer/rep_connector.cpp
// =============================================================================
#include "dialer/rep_connector.h"
#include "persistence/rep_pool.h"
#include "telephony/telephony_provider.h"
#include "model/call_attempt.h"
#include "common/logger.h"

namespace turbo_dialer {

namespace {

const char* kRepPlaceholder = "{rep_id}";

VoiceResponse notice_and_hangup(const char* text) {
    VoiceResponse vr;
    vr.say(text).hangup();
    return vr;
}

} // namespace

RepConnector::RepConnector(const Config& config, const Dependencies& deps)
    : endpoint_template_(config.rep_endpoint)
    , ring_timeout_(config.rep_ring_timeout)
    , urls_(config.public_base_url)
    , deps_(deps)
{}

std::string RepConnector::endpoint_for(const std::string& rep_id) const {
    std::string out = endpoint_template_;
    auto pos = out.find(kRepPlaceholder);
    if (pos != std::string::npos) out.replace(pos, std::char_traits<char>::length(kRepPlaceholder), rep_id);
    return out;
}

Result RepConnector::ring_rep(const RepClaim& claim, const std::string& caller_id,
                              std::string& leg_handle) {
    PlaceCallRequest req;
    req.to                  = endpoint_for(claim.rep_id);
    req.from                = caller_id;
    req.answer_url          = urls_.session_join(claim.session_id, claim.conference_name);
    req.status_callback_url = urls_.rep_leg_status(claim.session_id, claim.conference_name);
    req.ring_timeout        = ring_timeout_;
    req.detect_machine      = false;

    Result r = deps_.provider->place_call(req, leg_handle);
    if (r != Result::kOk) {
        stats_.legs_failed.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("RepConnector: rep=%s at %s not dialed: %s",
                 claim.rep_id.c_str(), req.to.c_str(), result_to_string(r));
        return r;
    }
    stats_.legs_dialed.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO("RepConnector: rep=%s leg=%s ringing for conference=%s",
             claim.rep_id.c_str(), leg_handle.c_str(), claim.conference_name.c_str());
    return Result::kOk;
}

VoiceResponse RepConnector::join_document(const std::string& session_id,
                                          const std::string& conference_name) {
    RepSession session;
    Result r = deps_.reps->get(session_id, session);
    if (r != Result::kOk) {
        stats_.joins_refused.fetch_add(1, std::memory_order_relaxed);
        if (r != Result::kNotFound) {
            LOG_ERROR("RepConnector: session=%s lookup failed: %s",
                      session_id.c_str(), result_to_string(r));
            return notice_and_hangup("An error occurred. Please try again.");
        }
        return notice_and_hangup("Your turbo session has ended.");
    }

    if (session.availability != RepAvailability::kClaimed ||
        (!conference_name.empty() && session.conference_name != conference_name)) {
        stats_.joins_refused.fetch_add(1, std::memory_order_relaxed);
        LOG_INFO("RepConnector: rep=%s has no call waiting in conference=%s",
                 session.rep_id.c_str(),
                 conference_name.empty() ? "-" : conference_name.c_str());
        return notice_and_hangup("No call is waiting. Goodbye.");
    }

    VoiceResponse::ConferenceOptions opts;
    opts.start_on_enter  = true;
    opts.end_on_exit     = true;
    opts.beep            = false;
    opts.status_callback = urls_.conference_status(session_id);
    opts.status_events   = "start end join leave";

    stats_.joins_served.fetch_add(1, std::memory_order_relaxed);
    VoiceResponse vr;
    vr.dial_conference(session.conference_name, opts);
    return vr;
}

Result RepConnector::handle_leg_status(const std::string& session_id,
                                       const std::string& conference_name,
                                       const std::string& provider_status) {
    auto status = map_provider_status(provider_status);
    if (!status || !is_terminal(*status)) return Result::kOk;
    if (conference_name.empty()) return Result::kInvalidArgument;

    stats_.legs_ended.fetch_add(1, std::memory_order_relaxed);
    Result r = deps_.reps->release_rep(session_id, conference_name);
    if (r == Result::kOk) {
        stats_.claims_released.fetch_add(1, std::memory_order_relaxed);
        if (*status != CallStatus::kCompleted) {
            LOG_WARN("RepConnector: rep leg for conference=%s ended %s before joining",
                     conference_name.c_str(), provider_status.c_str());
        } else {
            LOG_INFO("RepConnector: rep left conference=%s, session=%s available",
                     conference_name.c_str(), session_id.c_str());
        }
    } else if (r != Result::kNotFound) {
        LOG_ERROR("RepConnector: release of session=%s failed: %s",
                  session_id.c_str(), result_to_string(r));
    }
    return r;
}

} // namespace turbo_dialer

// =============================================================================
// FILE: src/http/webhook_handler.cpp
// =============================================================================
#include "http/webhook_handler.h"
#include "http/form_codec.h"
#include "dialer/answer_handler.h"
#include "dialer/lifecycle_processor.h"
#include "dialer/voicemail_finisher.h"
#include "dialer/rep_connector.h"
#include "common/slow_handler_logger.h"
#include "common/logger.h"

#include <cstdlib>
#include <stdexcept>

namespace turbo_dialer {

namespace {

constexpr const char* kXmlContentType = "text/xml";

HttpServer::Response xml_response(const std::string& body) {
    HttpServer::Response resp;
    resp.status_code = 200;
    resp.content_type = kXmlContentType;
    resp.body = body;
    return resp;
}

HttpServer::Response empty_response() {
    return xml_response(VoiceResponse().to_xml());
}

HttpServer::Response apology_response() {
    VoiceResponse vr;
    vr.say("We are sorry, we are unable to take your call right now. Goodbye.").hangup();
    return xml_response(vr.to_xml());
}

// Body params first, query string fills what the body lacks.
FormMap collect_params(const HttpServer::Request& req) {
    FormMap params = parse_form(req.body);
    for (const auto& [k, v] : req.query_params) params.emplace(k, v);
    return params;
}

int parse_int_or_zero(const std::string& s) {
    if (s.empty()) return 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str() || v < 0 || v > 86400 * 7) return 0;
    return static_cast<int>(v);
}

} // namespace

void WebhookHandler::register_routes(HttpServer& server, const Dependencies& deps) {
    auto d = deps;

    server.route("POST", "/turbo/lead-answered",
                 [d](const HttpServer::Request& r) { return handle_lead_answered(r, d); });
    server.route("POST", "/turbo/call-status",
                 [d](const HttpServer::Request& r) { return handle_call_status(r, d); });
    server.route("POST", "/turbo/conference-status",
                 [d](const HttpServer::Request& r) { return handle_conference_status(r, d); });
    server.route("POST", "/turbo/voicemail",
                 [d](const HttpServer::Request& r) { return handle_voicemail(r, d); });
    server.route("POST", "/turbo/voicemail/transcription",
                 [d](const HttpServer::Request& r) { return handle_transcription(r, d); });
    server.route("POST", "/turbo/session/twiml",
                 [d](const HttpServer::Request& r) { return handle_session_join(r, d); });
    server.route("POST", "/turbo/rep-leg-status",
                 [d](const HttpServer::Request& r) { return handle_rep_leg_status(r, d); });
}

HttpServer::Response WebhookHandler::handle_lead_answered(const HttpServer::Request& req,
                                                          const Dependencies& d) {
    FormMap p = collect_params(req);
    std::string call_handle = form_value(p, "CallSid");
    std::string answered_by = form_value(p, "AnsweredBy");
    CallLogScope scope(call_handle);
    LOG_WEBHOOK("lead-answered call=%s answered_by=%s",
                call_handle.c_str(), answered_by.empty() ? "-" : answered_by.c_str());

    if (!d.answer || call_handle.empty()) {
        LOG_WARN("lead-answered: missing CallSid");
        return apology_response();
    }

    try {
        if (d.slow_logger) {
            SlowHandlerLogger::Timer timer(*d.slow_logger, "lead-answered", call_handle, answered_by);
            return xml_response(d.answer->handle_answer(call_handle, answered_by).to_xml());
        }
        return xml_response(d.answer->handle_answer(call_handle, answered_by).to_xml());
    } catch (const std::exception& e) {
        LOG_ERROR("lead-answered call=%s failed: %s", call_handle.c_str(), e.what());
        return apology_response();
    }
}

HttpServer::Response WebhookHandler::handle_call_status(const HttpServer::Request& req,
                                                        const Dependencies& d) {
    FormMap p = collect_params(req);
    CallStatusEvent ev;
    ev.call_handle     = form_value(p, "CallSid");
    ev.provider_status = form_value(p, "CallStatus");
    ev.duration_sec    = parse_int_or_zero(form_value(p, "CallDuration"));
    ev.recording_url   = form_value(p, "RecordingUrl");
    CallLogScope scope(ev.call_handle);
    LOG_WEBHOOK("call-status call=%s status=%s duration=%d",
                ev.call_handle.c_str(), ev.provider_status.c_str(), ev.duration_sec);

    if (!d.lifecycle || ev.call_handle.empty() || ev.provider_status.empty()) {
        LOG_WARN("call-status: missing CallSid or CallStatus");
        return empty_response();
    }

    try {
        LifecycleProcessor::Outcome outcome;
        if (d.slow_logger) {
            SlowHandlerLogger::Timer timer(*d.slow_logger, "call-status", ev.call_handle,
                                           ev.provider_status);
            outcome = d.lifecycle->handle_call_status(ev);
        } else {
            outcome = d.lifecycle->handle_call_status(ev);
        }
        LOG_DEBUG("call-status call=%s -> %s", ev.call_handle.c_str(),
                  lifecycle_outcome_to_string(outcome));
    } catch (const std::exception& e) {
        LOG_ERROR("call-status call=%s failed: %s", ev.call_handle.c_str(), e.what());
    }
    return empty_response();
}

HttpServer::Response WebhookHandler::handle_conference_status(const HttpServer::Request& req,
                                                              const Dependencies& d) {
    FormMap p = collect_params(req);
    ConferenceEvent ev;
    ev.session_id     = form_value(p, "session_id");
    ev.event          = form_value(p, "StatusCallbackEvent");
    ev.call_handle    = form_value(p, "CallSid");
    ev.conference_sid = form_value(p, "ConferenceSid");
    ev.conference_name = form_value(p, "FriendlyName");
    if (ev.conference_name.empty()) ev.conference_name = form_value(p, "conference");
    CallLogScope scope(ev.call_handle);
    LOG_WEBHOOK("conference-status session=%s event=%s call=%s conference=%s",
                ev.session_id.c_str(), ev.event.c_str(), ev.call_handle.c_str(),
                ev.conference_name.empty() ? "-" : ev.conference_name.c_str());

    if (!d.lifecycle || ev.session_id.empty() || ev.event.empty()) {
        LOG_WARN("conference-status: missing session_id or StatusCallbackEvent");
        return empty_response();
    }

    try {
        auto outcome = d.lifecycle->handle_conference_event(ev);
        LOG_DEBUG("conference-status session=%s event=%s -> %s", ev.session_id.c_str(),
                  ev.event.c_str(), lifecycle_outcome_to_string(outcome));
    } catch (const std::exception& e) {
        LOG_ERROR("conference-status session=%s failed: %s", ev.session_id.c_str(), e.what());
    }
    return empty_response();
}

HttpServer::Response WebhookHandler::handle_voicemail(const HttpServer::Request& req,
                                                      const Dependencies& d) {
    FormMap p = collect_params(req);
    std::string call_handle = form_value(p, "call_handle");
    if (call_handle.empty()) call_handle = form_value(p, "CallSid");
    std::string recording_url = form_value(p, "RecordingUrl");
    CallLogScope scope(call_handle);
    LOG_WEBHOOK("voicemail call=%s recording=%s", call_handle.c_str(), recording_url.c_str());

    VoiceResponse goodbye;
    goodbye.say("Thank you. Goodbye.").hangup();
    if (!d.voicemail || call_handle.empty()) return xml_response(goodbye.to_xml());

    try {
        return xml_response(d.voicemail->handle_recording(call_handle, recording_url).to_xml());
    } catch (const std::exception& e) {
        LOG_ERROR("voicemail call=%s failed: %s", call_handle.c_str(), e.what());
        return xml_response(goodbye.to_xml());
    }
}

HttpServer::Response WebhookHandler::handle_transcription(const HttpServer::Request& req,
                                                          const Dependencies& d) {
    FormMap p = collect_params(req);
    std::string call_handle = form_value(p, "call_handle");
    if (call_handle.empty()) call_handle = form_value(p, "CallSid");
    std::string text   = form_value(p, "TranscriptionText");
    std::string status = form_value(p, "TranscriptionStatus");
    CallLogScope scope(call_handle);
    LOG_WEBHOOK("transcription call=%s status=%s chars=%zu",
                call_handle.c_str(), status.c_str(), text.size());

    if (!d.voicemail || call_handle.empty()) return empty_response();

    try {
        Result r = d.voicemail->handle_transcription(call_handle, text, status);
        if (r != Result::kOk) {
            LOG_WARN("transcription call=%s not stored: %s", call_handle.c_str(),
                     result_to_string(r));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("transcription call=%s failed: %s", call_handle.c_str(), e.what());
    }
    return empty_response();
}

HttpServer::Response WebhookHandler::handle_session_join(const HttpServer::Request& req,
                                                         const Dependencies& d) {
    FormMap p = collect_params(req);
    std::string session_id = form_value(p, "session_id");
    std::string conference = form_value(p, "conference");
    std::string call_handle = form_value(p, "CallSid");
    CallLogScope scope(call_handle);
    LOG_WEBHOOK("session-join session=%s conference=%s call=%s", session_id.c_str(),
                conference.empty() ? "-" : conference.c_str(), call_handle.c_str());

    if (!d.connector || session_id.empty()) {
        LOG_WARN("session-join: missing session_id");
        VoiceResponse vr;
        vr.say("Missing session. Goodbye.").hangup();
        return xml_response(vr.to_xml());
    }

    try {
        return xml_response(d.connector->join_document(session_id, conference).to_xml());
    } catch (const std::exception& e) {
        LOG_ERROR("session-join session=%s failed: %s", session_id.c_str(), e.what());
        return apology_response();
    }
}

HttpServer::Response WebhookHandler::handle_rep_leg_status(const HttpServer::Request& req,
                                                           const Dependencies& d) {
    FormMap p = collect_params(req);
    std::string session_id = form_value(p, "session_id");
    std::string conference = form_value(p, "conference");
    std::string status     = form_value(p, "CallStatus");
    std::string call_handle = form_value(p, "CallSid");
    CallLogScope scope(call_handle);
    LOG_WEBHOOK("rep-leg-status session=%s conference=%s call=%s status=%s",
                session_id.c_str(), conference.c_str(), call_handle.c_str(), status.c_str());

    if (!d.connector || session_id.empty() || status.empty()) {
        LOG_WARN("rep-leg-status: missing session_id or CallStatus");
        return empty_response();
    }

    try {
        Result r = d.connector->handle_leg_status(session_id, conference, status);
        if (r != Result::kOk && r != Result::kNotFound) {
            LOG_WARN("rep-leg-status session=%s not applied: %s", session_id.c_str(),
                     result_to_string(r));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("rep-leg-status session=%s failed: %s", session_id.c_str(), e.what());
    }
    return empty_response();
}

} // namespace turbo_dialer

// =============================================================================
// FILE: src/dialer/callback_urls.cpp
// =============================================================================
#include "dialer/callback_urls.h"
#include "http/form_codec.h"
#include <utility>

namespace turbo_dialer {

CallbackUrls::CallbackUrls(std::string public_base_url) : base_(std::move(public_base_url)) {
    while (!base_.empty() && base_.back() == '/') base_.pop_back();
}

std::string CallbackUrls::lead_answered() const {
    return base_ + "/turbo/lead-answered";
}

std::string CallbackUrls::call_status() const {
    return base_ + "/turbo/call-status";
}

std::string CallbackUrls::conference_status(const std::string& session_id) const {
    return base_ + "/turbo/conference-status?session_id=" + url_encode(session_id);
}

std::string CallbackUrls::voicemail(const std::string& call_handle) const {
    return base_ + "/turbo/voicemail?call_handle=" + url_encode(call_handle);
}

std::string CallbackUrls::voicemail_transcription(const std::string& call_handle) const {
    return base_ + "/turbo/voicemail/transcription?call_handle=" + url_encode(call_handle);
}

std::string CallbackUrls::session_join(const std::string& session_id,
                                       const std::string& conference_name) const {
    std::string url = base_ + "/turbo/session/twiml?session_id=" + url_encode(session_id);
    if (!conference_name.empty()) url += "&conference=" + url_encode(conference_name);
    return url;
}

std::string CallbackUrls::rep_leg_status(const std::string& session_id,
                                         const std::string& conference_name) const {
    return base_ + "/turbo/rep-leg-status?session_id=" + url_encode(session_id) +
           "&conference=" + url_encode(conference_name);
}

} // namespace turbo_dialer

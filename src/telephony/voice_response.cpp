// =============================================================================
// FILE: src/telephony/voice_response.cpp
// =============================================================================
#include "telephony/voice_response.h"
#include <sstream>

namespace turbo_dialer {

namespace {

const char* kVoice = "alice";

const char* bool_attr(bool b) { return b ? "true" : "false"; }

void write_attributes(std::ostringstream& out, const VoiceResponse::Attributes& attrs) {
    for (const auto& [k, v] : attrs) {
        out << ' ' << k << "=\"" << xml_escape(v) << '"';
    }
}

} // namespace

std::string xml_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c;        break;
        }
    }
    return out;
}

VoiceResponse& VoiceResponse::say(const std::string& text) {
    instructions_.push_back({Verb::kSay, text, {{"voice", kVoice}}});
    return *this;
}

VoiceResponse& VoiceResponse::pause(Seconds length) {
    instructions_.push_back({Verb::kPause, "", {{"length", std::to_string(length.count())}}});
    return *this;
}

VoiceResponse& VoiceResponse::redirect(const std::string& url) {
    instructions_.push_back({Verb::kRedirect, url, {{"method", "POST"}}});
    return *this;
}

VoiceResponse& VoiceResponse::hangup() {
    instructions_.push_back({Verb::kHangup, "", {}});
    return *this;
}

VoiceResponse& VoiceResponse::dial_conference(const std::string& name,
                                              const ConferenceOptions& o) {
    Attributes attrs = {
        {"startConferenceOnEnter", bool_attr(o.start_on_enter)},
        {"endConferenceOnExit", bool_attr(o.end_on_exit)},
        {"beep", bool_attr(o.beep)},
    };
    if (!o.status_callback.empty()) {
        attrs.emplace_back("statusCallback", o.status_callback);
        attrs.emplace_back("statusCallbackEvent", o.status_events);
        attrs.emplace_back("statusCallbackMethod", "POST");
    }
    instructions_.push_back({Verb::kDialConference, name, std::move(attrs)});
    return *this;
}

VoiceResponse& VoiceResponse::record(const RecordOptions& o) {
    Attributes attrs = {
        {"maxLength", std::to_string(o.max_length.count())},
        {"playBeep", bool_attr(o.play_beep)},
        {"transcribe", bool_attr(o.transcribe)},
    };
    if (!o.action.empty()) attrs.emplace_back("action", o.action);
    if (o.transcribe && !o.transcribe_callback.empty()) {
        attrs.emplace_back("transcribeCallback", o.transcribe_callback);
    }
    instructions_.push_back({Verb::kRecord, "", std::move(attrs)});
    return *this;
}

const VoiceResponse::Instruction* VoiceResponse::find(Verb verb) const {
    for (const auto& ins : instructions_) {
        if (ins.verb == verb) return &ins;
    }
    return nullptr;
}

std::string VoiceResponse::attribute(const Instruction& ins, const std::string& name) {
    for (const auto& [k, v] : ins.attributes) {
        if (k == name) return v;
    }
    return "";
}

std::string VoiceResponse::to_xml() const {
    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?><Response>";
    for (const auto& ins : instructions_) {
        switch (ins.verb) {
            case Verb::kSay:
                out << "<Say";
                write_attributes(out, ins.attributes);
                out << '>' << xml_escape(ins.text) << "</Say>";
                break;
            case Verb::kPause:
                out << "<Pause";
                write_attributes(out, ins.attributes);
                out << "/>";
                break;
            case Verb::kRedirect:
                out << "<Redirect";
                write_attributes(out, ins.attributes);
                out << '>' << xml_escape(ins.text) << "</Redirect>";
                break;
            case Verb::kHangup:
                out << "<Hangup/>";
                break;
            case Verb::kDialConference:
                out << "<Dial><Conference";
                write_attributes(out, ins.attributes);
                out << '>' << xml_escape(ins.text) << "</Conference></Dial>";
                break;
            case Verb::kRecord:
                out << "<Record";
                write_attributes(out, ins.attributes);
                out << "/>";
                break;
        }
    }
    out << "</Response>";
    return out.str();
}

} // namespace turbo_dialer

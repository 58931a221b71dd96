// =============================================================================
// FILE: include/telephony/voice_response.h
// =============================================================================
#ifndef VOICE_RESPONSE_H
#define VOICE_RESPONSE_H

#include "common/types.h"
#include <string>
#include <utility>
#include <vector>

namespace turbo_dialer {

// Builder for the voice instruction document returned to the provider from
// the answer and voicemail callbacks (TwiML dialect).
//
//   VoiceResponse vr;
//   vr.say("One moment please.").pause(Seconds(2)).redirect(url);
//   std::string xml = vr.to_xml();
class VoiceResponse {
public:
    enum class Verb { kSay, kPause, kRedirect, kHangup, kDialConference, kRecord };

    using Attributes = std::vector<std::pair<std::string, std::string>>;

    struct Instruction {
        Verb        verb;
        std::string text;        // Say text, Redirect url, conference name
        Attributes  attributes;
    };

    struct ConferenceOptions {
        bool        start_on_enter = false;
        bool        end_on_exit    = false;
        bool        beep           = false;
        std::string status_callback;
        std::string status_events  = "join leave";
    };

    struct RecordOptions {
        Seconds     max_length = Seconds(120);
        bool        transcribe = true;
        bool        play_beep  = true;
        std::string action;
        std::string transcribe_callback;
    };

    VoiceResponse& say(const std::string& text);
    VoiceResponse& pause(Seconds length);
    VoiceResponse& redirect(const std::string& url);
    VoiceResponse& hangup();
    VoiceResponse& dial_conference(const std::string& name, const ConferenceOptions& options);
    VoiceResponse& record(const RecordOptions& options);

    std::string to_xml() const;

    const std::vector<Instruction>& instructions() const { return instructions_; }
    bool empty() const { return instructions_.empty(); }

    // nullptr when the document has no such verb
    const Instruction* find(Verb verb) const;
    bool has(Verb verb) const { return find(verb) != nullptr; }

    // "" when absent
    static std::string attribute(const Instruction& ins, const std::string& name);

private:
    std::vector<Instruction> instructions_;
};

std::string xml_escape(const std::string& s);

} // namespace turbo_dialer
#endif // VOICE_RESPONSE_H

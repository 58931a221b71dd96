// =============================================================================
// FILE: include/dialer/callback_urls.h
// =============================================================================
#ifndef CALLBACK_URLS_H
#define CALLBACK_URLS_H

#include <string>

namespace turbo_dialer {

// Public URLs of our webhook routes, handed to the provider inside call
// requests and instruction documents.
class CallbackUrls {
public:
    explicit CallbackUrls(std::string public_base_url);

    std::string lead_answered() const;
    std::string call_status() const;
    std::string conference_status(const std::string& session_id) const;
    std::string voicemail(const std::string& call_handle) const;
    std::string voicemail_transcription(const std::string& call_handle) const;

    // Answer URL of a rep leg. An empty conference joins whatever the
    // session currently holds.
    std::string session_join(const std::string& session_id,
                             const std::string& conference_name = "") const;
    std::string rep_leg_status(const std::string& session_id,
                               const std::string& conference_name) const;

private:
    std::string base_;
};

} // namespace turbo_dialer
#endif // CALLBACK_URLS_H

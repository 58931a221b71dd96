// =============================================================================
// FILE: include/http/rest_client.h
// =============================================================================
#ifndef HTTP_REST_CLIENT_H
#define HTTP_REST_CLIENT_H

#include "common/types.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace turbo_dialer {

// Splits "https://host:port/base" into its parts. Port defaults from the
// scheme. Returns false for an empty host or a malformed port.
bool parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path);

// Thin synchronous wrapper over cpp-httplib used by the outbound adapters
// (telephony provider, CRM). Transport failures come back as Result codes,
// never as exceptions; the HTTP status is left for the caller to judge.
class RestClient {
public:
    using FormFields = std::vector<std::pair<std::string, std::string>>;

    struct Response {
        int         status = 0;
        std::string body;
    };

    RestClient(const std::string& base_url, Millisecs timeout);
    ~RestClient();

    // false when the base URL could not be parsed or https was requested
    // without TLS support compiled in.
    bool valid() const { return valid_; }
    const std::string& host() const { return host_; }

    void set_basic_auth(const std::string& user, const std::string& password);
    void set_bearer_token(const std::string& token);

    // application/x-www-form-urlencoded; repeated keys are sent repeated
    Result post_form(const std::string& path, const FormFields& fields, Response& out);
    Result post_json(const std::string& path, const std::string& body, Response& out);
    Result patch_json(const std::string& path, const std::string& body, Response& out);

    RestClient(const RestClient&) = delete;
    RestClient& operator=(const RestClient&) = delete;

private:
    std::string build_path(const std::string& path) const;

    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string scheme_;
    std::string host_;
    int         port_ = 0;
    std::string base_path_;
    bool        valid_ = false;
};

inline bool is_http_success(int status) { return status >= 200 && status < 300; }

} // namespace turbo_dialer
#endif // HTTP_REST_CLIENT_H

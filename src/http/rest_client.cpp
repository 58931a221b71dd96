// =============================================================================
// FILE: src/http/rest_client.cpp
// =============================================================================
#include "http/rest_client.h"
#include "common/logger.h"

#include <httplib.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace turbo_dialer {

bool parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path) {
    std::string working = url;
    scheme = "http";
    base_path.clear();
    host.clear();
    port = 0;

    auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        scheme = working.substr(0, scheme_pos);
        std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        working = working.substr(scheme_pos + 3);
    }

    auto path_pos = working.find('/');
    if (path_pos != std::string::npos) {
        base_path = working.substr(path_pos);
        working = working.substr(0, path_pos);
    }
    if (!base_path.empty() && base_path.back() == '/') base_path.pop_back();

    auto port_pos = working.find(':');
    if (port_pos != std::string::npos) {
        host = working.substr(0, port_pos);
        try {
            port = std::stoi(working.substr(port_pos + 1));
        } catch (const std::logic_error&) {
            return false;
        }
        if (port <= 0 || port > 65535) return false;
    } else {
        host = working;
        port = scheme == "https" ? 443 : 80;
    }
    return !host.empty();
}

struct RestClient::Impl {
    std::unique_ptr<httplib::Client> http;
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    std::unique_ptr<httplib::SSLClient> https;
#endif

    template <typename Fn>
    httplib::Result send(Fn&& fn) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        if (https) return fn(*https);
#endif
        return fn(*http);
    }

    template <typename Fn>
    void each(Fn&& fn) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        if (https) fn(*https);
#endif
        if (http) fn(*http);
    }
};

RestClient::RestClient(const std::string& base_url, Millisecs timeout)
    : impl_(std::make_unique<Impl>())
{
    if (!parse_url(base_url, scheme_, host_, port_, base_path_)) {
        LOG_ERROR("RestClient: invalid base url '%s'", base_url.c_str());
        return;
    }

    if (scheme_ == "https") {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        impl_->https = std::make_unique<httplib::SSLClient>(host_, port_);
#else
        LOG_ERROR("RestClient: %s requires TLS support (CPPHTTPLIB_OPENSSL_SUPPORT)",
                  base_url.c_str());
        return;
#endif
    } else {
        impl_->http = std::make_unique<httplib::Client>(host_, port_);
    }

    time_t sec  = static_cast<time_t>(timeout.count() / 1000);
    time_t usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
    impl_->each([sec, usec](auto& cli) {
        cli.set_connection_timeout(sec, usec);
        cli.set_read_timeout(sec, usec);
        cli.set_write_timeout(sec, usec);
    });
    valid_ = true;
}

RestClient::~RestClient() = default;

void RestClient::set_basic_auth(const std::string& user, const std::string& password) {
    impl_->each([&](auto& cli) { cli.set_basic_auth(user, password); });
}

void RestClient::set_bearer_token(const std::string& token) {
    impl_->each([&](auto& cli) { cli.set_bearer_token_auth(token); });
}

std::string RestClient::build_path(const std::string& path) const {
    if (path.empty()) return base_path_.empty() ? "/" : base_path_;
    if (path.front() == '/') return base_path_ + path;
    return base_path_ + "/" + path;
}

namespace {

Result finish(httplib::Result res, const std::string& host, const std::string& path,
              RestClient::Response& out) {
    if (!res) {
        LOG_WARN("HTTP %s%s: %s", host.c_str(), path.c_str(),
                 httplib::to_string(res.error()).c_str());
        return res.error() == httplib::Error::ConnectionTimeout ||
               res.error() == httplib::Error::Read
                   ? Result::kTimeout : Result::kConnectionLost;
    }
    out.status = res->status;
    out.body   = res->body;
    return Result::kOk;
}

} // namespace

Result RestClient::post_form(const std::string& path, const FormFields& fields, Response& out) {
    if (!valid_) return Result::kInvalidArgument;
    httplib::Params params;
    for (const auto& kv : fields) params.emplace(kv.first, kv.second);
    httplib::Headers headers{{"Accept", "application/json"}};

    std::string full = build_path(path);
    auto res = impl_->send([&](auto& cli) { return cli.Post(full, headers, params); });
    return finish(std::move(res), host_, full, out);
}

Result RestClient::post_json(const std::string& path, const std::string& body, Response& out) {
    if (!valid_) return Result::kInvalidArgument;
    httplib::Headers headers{{"Accept", "application/json"}};

    std::string full = build_path(path);
    auto res = impl_->send([&](auto& cli) {
        return cli.Post(full, headers, body, "application/json");
    });
    return finish(std::move(res), host_, full, out);
}

Result RestClient::patch_json(const std::string& path, const std::string& body, Response& out) {
    if (!valid_) return Result::kInvalidArgument;
    httplib::Headers headers{{"Accept", "application/json"}};

    std::string full = build_path(path);
    auto res = impl_->send([&](auto& cli) {
        return cli.Patch(full, headers, body, "application/json");
    });
    return finish(std::move(res), host_, full, out);
}

} // namespace turbo_dialer

// =============================================================================
// FILE: src/http/http_server.cpp
// =============================================================================
#include "http/http_server.h"
#include "http/form_codec.h"
#include "common/logger.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <poll.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <sstream>

namespace turbo_dialer {

namespace {

constexpr size_t kMaxHeadBytes = 16 * 1024;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

HttpServer::Response error_response(int status, const std::string& error) {
    HttpServer::Response resp;
    resp.status_code = status;
    resp.body = R"({"error":")" + error + R"("})";
    return resp;
}

} // namespace

HttpServer::HttpServer(const Config& config) : config_(config) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::route(const std::string& method, const std::string& path, Handler handler) {
    std::lock_guard<std::mutex> lk(routes_mu_);
    routes_[method + ":" + path] = std::move(handler);
}

Result HttpServer::start() {
    if (!config_.http_enabled) { LOG_INFO("HTTP server disabled"); return Result::kOk; }
    if (running_.load()) return Result::kAlreadyExists;

    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) { LOG_ERROR("HTTP: socket failed: %s", strerror(errno)); return Result::kError; }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.http_port);
    if (inet_pton(AF_INET, config_.http_bind_address.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("HTTP: bad bind address '%s'", config_.http_bind_address.c_str());
        close(server_fd_); server_fd_ = -1;
        return Result::kInvalidArgument;
    }

    if (bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_ERROR("HTTP: bind failed on %s:%d: %s",
                  config_.http_bind_address.c_str(), config_.http_port, strerror(errno));
        close(server_fd_); server_fd_ = -1;
        return Result::kError;
    }

    if (listen(server_fd_, static_cast<int>(config_.http_max_connections)) < 0) {
        LOG_ERROR("HTTP: listen failed"); close(server_fd_); server_fd_ = -1;
        return Result::kError;
    }

    stop_requested_.store(false); running_.store(true);
    size_t n = std::max<size_t>(1, config_.http_worker_threads);
    for (size_t i = 0; i < n; ++i) {
        workers_.emplace_back(&HttpServer::worker_thread_func, this);
    }
    acceptor_thread_ = std::thread(&HttpServer::acceptor_thread_func, this);

    LOG_INFO("HTTP server started on %s:%d with %zu workers",
             config_.http_bind_address.c_str(), config_.http_port, n);
    return Result::kOk;
}

void HttpServer::stop() {
    if (!running_.load()) return;
    stop_requested_.store(true);
    if (server_fd_ >= 0) { shutdown(server_fd_, SHUT_RDWR); close(server_fd_); server_fd_ = -1; }
    if (acceptor_thread_.joinable()) acceptor_thread_.join();

    pending_cv_.notify_all();
    for (auto& w : workers_) if (w.joinable()) w.join();
    workers_.clear();

    // Connections accepted but never served
    std::lock_guard<std::mutex> lk(pending_mu_);
    for (int fd : pending_) close(fd);
    pending_.clear();

    running_.store(false);
    LOG_INFO("HTTP server stopped");
}

void HttpServer::acceptor_thread_func() {
    while (!stop_requested_.load(std::memory_order_acquire)) {
        struct pollfd pfd{server_fd_, POLLIN, 0};
        int pr = poll(&pfd, 1, 500);
        if (pr <= 0) continue;
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) break;

        struct sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);
        int client_fd = accept(server_fd_, reinterpret_cast<sockaddr*>(&client_addr), &addr_len);
        if (client_fd < 0) { if (errno != EINTR) LOG_WARN("HTTP: accept failed"); continue; }

        stats_.requests_total.fetch_add(1);
        {
            std::lock_guard<std::mutex> lk(pending_mu_);
            if (pending_.size() >= config_.http_max_connections) {
                stats_.requests_rejected.fetch_add(1);
                LOG_WARN("HTTP: %zu connections waiting, rejecting", pending_.size());
                std::string raw = serialize_response(error_response(503, "overloaded"));
                send(client_fd, raw.c_str(), raw.size(), MSG_NOSIGNAL);
                close(client_fd);
                continue;
            }
            pending_.push_back(client_fd);
            stats_.pending_connections.store(pending_.size());
        }
        pending_cv_.notify_one();
    }
}

void HttpServer::worker_thread_func() {
    while (true) {
        int fd = -1;
        {
            std::unique_lock<std::mutex> lk(pending_mu_);
            pending_cv_.wait(lk, [this] { return stop_requested_.load() || !pending_.empty(); });
            if (stop_requested_.load()) return;
            fd = pending_.front();
            pending_.pop_front();
            stats_.pending_connections.store(pending_.size());
        }
        stats_.active_connections.fetch_add(1);
        handle_client(fd);
        close(fd);
        stats_.active_connections.fetch_sub(1);
    }
}

bool HttpServer::read_request(int client_fd, Request& req, int& error_status) {
    std::string data;
    char buf[8192];
    size_t head_end = std::string::npos;

    while (head_end == std::string::npos) {
        ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
        if (n <= 0) { error_status = 0; return false; }
        data.append(buf, static_cast<size_t>(n));
        head_end = data.find("\r\n\r\n");
        if (head_end == std::string::npos && data.size() > kMaxHeadBytes) {
            error_status = 431;
            return false;
        }
    }

    if (!parse_request_head(data.substr(0, head_end), req)) {
        error_status = 400;
        return false;
    }

    size_t content_length = 0;
    std::string cl = req.header("content-length");
    if (!cl.empty()) {
        try {
            content_length = static_cast<size_t>(std::stoull(cl));
        } catch (const std::logic_error&) {
            error_status = 400;
            return false;
        }
    }
    if (content_length > config_.http_max_body_bytes) {
        error_status = 413;
        return false;
    }

    req.body = data.substr(head_end + 4);
    while (req.body.size() < content_length) {
        ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
        if (n <= 0) { error_status = 400; return false; }
        req.body.append(buf, static_cast<size_t>(n));
    }
    if (req.body.size() > content_length) req.body.resize(content_length);
    return true;
}

void HttpServer::handle_client(int client_fd) {
    // Set read timeout
    struct timeval tv;
    tv.tv_sec = config_.http_read_timeout.count(); tv.tv_usec = 0;
    setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    Request req;
    int error_status = 0;
    Response resp;
    if (read_request(client_fd, req, error_status)) {
        resp = dispatch(req);
    } else {
        if (error_status == 0) return;  // peer went away
        stats_.requests_error.fetch_add(1);
        resp = error_response(error_status, error_status == 413 ? "body_too_large" : "bad_request");
    }

    std::string raw_resp = serialize_response(resp);
    send(client_fd, raw_resp.c_str(), raw_resp.size(), MSG_NOSIGNAL);
}

HttpServer::Response HttpServer::dispatch(const Request& req) {
    // Find handler: exact match, then longest prefix
    Handler handler;
    bool other_method = false;
    {
        std::lock_guard<std::mutex> lk(routes_mu_);

        auto it = routes_.find(req.method + ":" + req.path);
        if (it != routes_.end()) {
            handler = it->second;
        } else {
            size_t best = 0;
            for (auto& [route_key, h] : routes_) {
                auto colon = route_key.find(':');
                if (colon == std::string::npos) continue;
                std::string rm = route_key.substr(0, colon);
                std::string rp = route_key.substr(colon + 1);
                if (req.path.compare(0, rp.size(), rp) != 0) continue;
                if (rm != req.method) {
                    if (rp == req.path) other_method = true;
                    continue;
                }
                if (rp.size() > best) { best = rp.size(); handler = h; }
            }
        }
    }

    Response resp;
    if (handler) {
        try {
            resp = handler(req);
            stats_.requests_ok.fetch_add(1);
        } catch (const std::exception& e) {
            LOG_ERROR("HTTP: %s %s handler threw: %s", req.method.c_str(), req.path.c_str(), e.what());
            resp = error_response(500, "internal_error");
            stats_.requests_error.fetch_add(1);
        }
    } else if (other_method) {
        resp = error_response(405, "method_not_allowed");
    } else {
        resp.status_code = 404;
        resp.body = R"({"error":"not_found","path":")" + req.path + R"("})";
    }
    return resp;
}

bool HttpServer::parse_request_head(const std::string& head, Request& req) {
    std::istringstream stream(head);
    std::string line;

    // Request line: POST /path?query HTTP/1.1
    if (!std::getline(stream, line)) return false;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    auto sp1 = line.find(' ');
    auto sp2 = sp1 == std::string::npos ? std::string::npos : line.find(' ', sp1 + 1);
    if (sp1 == std::string::npos || sp2 == std::string::npos) return false;

    req.method = line.substr(0, sp1);
    std::string full_path = line.substr(sp1 + 1, sp2 - sp1 - 1);
    if (full_path.empty() || full_path.front() != '/') return false;

    auto qm = full_path.find('?');
    if (qm != std::string::npos) {
        req.path = full_path.substr(0, qm);
        req.query_string = full_path.substr(qm + 1);
        for (auto& [k, v] : parse_form(req.query_string)) req.query_params[k] = v;
    } else {
        req.path = full_path;
    }

    // Headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;
        auto colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = to_lower(line.substr(0, colon));
            std::string val = line.substr(colon + 1);
            val.erase(0, val.find_first_not_of(" \t"));
            req.headers[key] = val;
        }
    }
    return true;
}

std::string HttpServer::serialize_response(const Response& resp) {
    std::string status_text;
    switch (resp.status_code) {
        case 200: status_text = "OK"; break;
        case 201: status_text = "Created"; break;
        case 400: status_text = "Bad Request"; break;
        case 404: status_text = "Not Found"; break;
        case 405: status_text = "Method Not Allowed"; break;
        case 409: status_text = "Conflict"; break;
        case 413: status_text = "Payload Too Large"; break;
        case 431: status_text = "Request Header Fields Too Large"; break;
        case 500: status_text = "Internal Server Error"; break;
        case 503: status_text = "Service Unavailable"; break;
        default:  status_text = "Unknown"; break;
    }

    std::ostringstream ss;
    ss << "HTTP/1.1 " << resp.status_code << " " << status_text << "\r\n";
    ss << "Content-Type: " << resp.content_type << "\r\n";
    ss << "Content-Length: " << resp.body.size() << "\r\n";
    ss << "Connection: close\r\n";
    for (auto& [k, v] : resp.headers) ss << k << ": " << v << "\r\n";
    ss << "\r\n";
    ss << resp.body;
    return ss.str();
}

} // namespace turbo_dialer

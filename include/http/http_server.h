// =============================================================================
// FILE: include/http/http_server.h
// =============================================================================
#ifndef HTTP_SERVER_H
#define HTTP_SERVER_H

#include "common/types.h"
#include "common/config.h"
#include <string>
#include <thread>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <vector>

namespace turbo_dialer {

// Embedded HTTP/1.1 server carrying the provider webhooks, the CRM-facing
// JSON API and the ops endpoints.
//
// One acceptor thread polls the listen socket and hands connections to a
// fixed pool of workers (http.worker_threads), so a slow handler (a dispatch
// cycle placing thirty calls) does not hold up webhook deliveries. One
// request per connection, body read up to Content-Length.
class HttpServer {
public:
    explicit HttpServer(const Config& config);
    ~HttpServer();

    // HTTP request/response types
    struct Request {
        std::string method;
        std::string path;
        std::string query_string;
        std::unordered_map<std::string, std::string> query_params;   // url-decoded
        std::unordered_map<std::string, std::string> headers;        // keys lower-cased
        std::string body;

        std::string query(const std::string& key) const {
            auto it = query_params.find(key);
            return it == query_params.end() ? std::string() : it->second;
        }
        std::string header(const std::string& lower_key) const {
            auto it = headers.find(lower_key);
            return it == headers.end() ? std::string() : it->second;
        }
    };

    struct Response {
        int status_code = 200;
        std::string content_type = "application/json";
        std::string body;
        std::unordered_map<std::string, std::string> headers;
    };

    using Handler = std::function<Response(const Request&)>;

    // Register a route handler. Exact path match first, then the longest
    // registered prefix.
    void route(const std::string& method, const std::string& path, Handler handler);

    Result start();
    void stop();
    bool is_running() const { return running_.load(std::memory_order_acquire); }

    // Routing and parsing without a socket; used by tests.
    Response dispatch(const Request& req);
    static bool parse_request_head(const std::string& head, Request& req);

    struct ServerStats {
        std::atomic<uint64_t> requests_total{0};
        std::atomic<uint64_t> requests_ok{0};
        std::atomic<uint64_t> requests_error{0};
        std::atomic<uint64_t> requests_rejected{0};
        std::atomic<uint64_t> active_connections{0};
        std::atomic<uint64_t> pending_connections{0};
    };
    const ServerStats& stats() const { return stats_; }

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

private:
    void acceptor_thread_func();
    void worker_thread_func();
    void handle_client(int client_fd);
    bool read_request(int client_fd, Request& req, int& error_status);
    std::string serialize_response(const Response& resp);

    Config config_;
    int server_fd_ = -1;
    std::thread acceptor_thread_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    std::mutex pending_mu_;
    std::condition_variable pending_cv_;
    std::deque<int> pending_;

    // Route table: "METHOD:path" -> handler
    std::mutex routes_mu_;
    std::unordered_map<std::string, Handler> routes_;

    ServerStats stats_;
};

} // namespace turbo_dialer
#endif // HTTP_SERVER_H

// =============================================================================
// FILE: tests/test_http_server.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "http/http_server.h"

#include <stdexcept>

using namespace turbo_dialer;

class HttpServerTest : public ::testing::Test {
protected:
    HttpServerTest() : server_(Config{}) {
        server_.route("GET", "/health", [](const HttpServer::Request&) {
            HttpServer::Response r;
            r.body = "health";
            return r;
        });
        server_.route("POST", "/turbo/voicemail", [](const HttpServer::Request&) {
            HttpServer::Response r;
            r.body = "voicemail";
            return r;
        });
        server_.route("POST", "/turbo/voicemail/transcription", [](const HttpServer::Request&) {
            HttpServer::Response r;
            r.body = "transcription";
            return r;
        });
        server_.route("POST", "/turbo/boom", [](const HttpServer::Request&) -> HttpServer::Response {
            throw std::runtime_error("boom");
        });
    }

    HttpServer::Response call(const std::string& method, const std::string& path) {
        HttpServer::Request req;
        req.method = method;
        req.path = path;
        return server_.dispatch(req);
    }

    HttpServer server_;
};

TEST_F(HttpServerTest, ExactRoute) {
    auto r = call("GET", "/health");
    EXPECT_EQ(r.status_code, 200);
    EXPECT_EQ(r.body, "health");
    EXPECT_EQ(r.content_type, "application/json");
}

TEST_F(HttpServerTest, LongestPrefixWins) {
    EXPECT_EQ(call("POST", "/turbo/voicemail/transcription").body, "transcription");
    EXPECT_EQ(call("POST", "/turbo/voicemail/transcription/extra").body, "transcription");
    EXPECT_EQ(call("POST", "/turbo/voicemail/other").body, "voicemail");
}

TEST_F(HttpServerTest, WrongMethodIs405) {
    auto r = call("POST", "/health");
    EXPECT_EQ(r.status_code, 405);
    EXPECT_EQ(r.body, R"({"error":"method_not_allowed"})");
}

TEST_F(HttpServerTest, UnknownPathIs404) {
    auto r = call("GET", "/nope");
    EXPECT_EQ(r.status_code, 404);
    EXPECT_EQ(r.body, R"({"error":"not_found","path":"/nope"})");
}

TEST_F(HttpServerTest, HandlerExceptionIs500) {
    auto r = call("POST", "/turbo/boom");
    EXPECT_EQ(r.status_code, 500);
    EXPECT_EQ(r.body, R"({"error":"internal_error"})");
    EXPECT_EQ(server_.stats().requests_error.load(), 1u);
}

TEST(HttpRequestHead, ParsesLineQueryAndHeaders) {
    HttpServer::Request req;
    ASSERT_TRUE(HttpServer::parse_request_head(
        "POST /turbo/conference-status?session_id=S%201&x=a+b HTTP/1.1\r\n"
        "Host: dialer.example.com\r\n"
        "Content-Type: application/x-www-form-urlencoded\r\n"
        "Content-Length:  42\r\n", req));

    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.path, "/turbo/conference-status");
    EXPECT_EQ(req.query_string, "session_id=S%201&x=a+b");
    EXPECT_EQ(req.query("session_id"), "S 1");
    EXPECT_EQ(req.query("x"), "a b");
    EXPECT_EQ(req.header("host"), "dialer.example.com");
    EXPECT_EQ(req.header("content-type"), "application/x-www-form-urlencoded");
    EXPECT_EQ(req.header("content-length"), "42");
}

TEST(HttpRequestHead, RejectsMalformed) {
    HttpServer::Request req;
    EXPECT_FALSE(HttpServer::parse_request_head("", req));
    EXPECT_FALSE(HttpServer::parse_request_head("GET\r\n", req));
    EXPECT_FALSE(HttpServer::parse_request_head("GET health HTTP/1.1\r\n", req));
}

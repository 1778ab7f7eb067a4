#pragma once

#include <string>
#include <functional>
#include <map>
#include <thread>
#include <atomic>
#include <condition_variable>
#include <mutex>

namespace runbox {

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string client_ip;

    // Case-insensitive header lookup; empty if absent
    std::string header(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
    }
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Minimal HTTP server - one thread per connection, one request per connection
class HttpServer {
public:
    HttpServer(int port = 3000);
    ~HttpServer();

    // Register route handlers (exact method + path match; query string ignored)
    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Start server. Blocks until stop(), then until every accepted
    // connection has been answered.
    void start();

    // Stop accepting connections
    void stop();

    // Connections accepted and not yet answered
    size_t active_connections() const;

    // Route a parsed request to its handler. Handler exceptions become 500s.
    HttpResponse dispatch(const HttpRequest& req) const;

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static std::string error_body(const std::string& message);

private:
    int port_;
    std::atomic<int> server_fd_;
    std::atomic<bool> running_;
    std::map<std::string, HandlerFunc> routes_;

    mutable std::mutex active_mutex_;
    std::condition_variable active_cv_;
    size_t active_connections_ = 0;

    void handle_client(int client_fd, const std::string& client_ip);
};

} // namespace runbox

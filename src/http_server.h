#pragma once

#include <string>
#include <functional>
#include <map>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include "constants.h"

namespace scriptbox {

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string client_ip;

    // Case-insensitive header lookup; "" when absent
    std::string header(const std::string& name) const;
};

struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
        headers["Access-Control-Allow-Origin"] = "*";
    }
};

using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Minimal HTTP/1.1 server, one thread per connection, one request per
// connection. Routes match exactly first, then by longest path prefix.
class HttpServer {
public:
    explicit HttpServer(int port = DEFAULT_PORT);
    ~HttpServer();

    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Blocks until stop() and until every accepted connection has been
    // answered. Throws std::runtime_error if the port cannot be bound.
    void start();

    void stop();

    // Port actually bound (differs from the requested one when that was 0); 0 before start()
    int bound_port() const { return bound_port_; }

    size_t active_connections();

    // Route a parsed request; handler exceptions become 500
    HttpResponse dispatch(const HttpRequest& req) const;

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static const char* reason_phrase(int status_code);

private:
    int port_;
    std::atomic<int> server_fd_;
    std::atomic<bool> running_;
    std::atomic<int> bound_port_{0};
    std::map<std::string, HandlerFunc> routes_;

    std::mutex connections_mutex_;
    std::condition_variable connections_drained_;
    size_t active_connections_ = 0;

    void handle_client(int client_fd, const std::string& client_ip);
};

} // namespace scriptbox

#include "http_server.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include <json/json.h>

namespace scriptbox {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

std::string error_body(const std::string& message) {
    Json::Value body;
    body["error"] = message;
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, body);
}

bool write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

void send_response(int fd, const HttpResponse& resp) {
    if (!write_all(fd, HttpServer::build_response(resp))) {
        std::cerr << "[Server] Failed to write response: " << strerror(errno) << std::endl;
    }
}

HttpResponse error_response(int status, const std::string& message) {
    HttpResponse resp;
    resp.status_code = status;
    resp.body = error_body(message);
    return resp;
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    std::string wanted = lowercase(name);
    for (const auto& [key, value] : headers) {
        if (lowercase(key) == wanted) {
            return value;
        }
    }
    return "";
}

HttpServer::HttpServer(int port) : port_(port), server_fd_(-1), running_(false) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = std::move(handler);
}

void HttpServer::start() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::cerr << "[Server] SO_REUSEADDR failed: " << strerror(errno) << std::endl;
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port_);

    if (bind(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        throw std::runtime_error("Failed to bind to port " + std::to_string(port_));
    }

    if (listen(fd, LISTEN_BACKLOG) < 0) {
        close(fd);
        throw std::runtime_error("Failed to listen");
    }

    struct sockaddr_in bound;
    socklen_t bound_len = sizeof(bound);
    if (getsockname(fd, (struct sockaddr*)&bound, &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port_;
    }

    server_fd_ = fd;
    running_ = true;
    std::cout << "[Server] Listening on port " << bound_port_ << std::endl;

    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(fd, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (running_ && errno == EINTR) continue;
            if (running_) {
                std::cerr << "[Server] accept failed: " << strerror(errno) << std::endl;
                continue;
            }
            break;
        }

        // A silent client must not hold shutdown open
        struct timeval read_timeout;
        read_timeout.tv_sec = CLIENT_READ_TIMEOUT_SECONDS;
        read_timeout.tv_usec = 0;
        if (setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &read_timeout, sizeof(read_timeout)) < 0) {
            std::cerr << "[Server] SO_RCVTIMEO failed: " << strerror(errno) << std::endl;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string client_ip = ip;

        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            active_connections_++;
        }
        std::thread([this, client_fd, client_ip]() {
            handle_client(client_fd, client_ip);
            close(client_fd);
            // Last touch of this object; start() may return right after
            std::lock_guard<std::mutex> lock(connections_mutex_);
            active_connections_--;
            connections_drained_.notify_all();
        }).detach();
    }

    int listening = server_fd_.exchange(-1);
    if (listening >= 0) {
        close(listening);
    }

    std::unique_lock<std::mutex> lock(connections_mutex_);
    if (active_connections_ > 0) {
        std::cout << "[Server] Waiting for " << active_connections_
                  << " open connections" << std::endl;
    }
    connections_drained_.wait(lock, [this]() { return active_connections_ == 0; });
}

size_t HttpServer::active_connections() {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return active_connections_;
}

void HttpServer::stop() {
    running_ = false;
    int fd = server_fd_.exchange(-1);
    if (fd >= 0) {
        // Wakes the accept() in start()
        shutdown(fd, SHUT_RDWR);
        close(fd);
    }
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    std::string request_data;
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    size_t expected_size = 0;

    while (expected_size == 0 || request_data.size() < expected_size) {
        ssize_t bytes_read = read(client_fd, buffer, sizeof(buffer));
        if (bytes_read < 0 && errno == EINTR) continue;
        if (bytes_read <= 0) break;

        if (request_data.size() + static_cast<size_t>(bytes_read) > MAX_REQUEST_SIZE) {
            send_response(client_fd, error_response(413, "Request too large"));
            return;
        }
        request_data.append(buffer, static_cast<size_t>(bytes_read));

        if (expected_size != 0) continue;

        size_t header_end = request_data.find("\r\n\r\n");
        if (header_end == std::string::npos) continue;

        HttpRequest head = parse_request(request_data.substr(0, header_end + 4));
        std::string length = head.header("Content-Length");
        if (length.empty()) {
            break;
        }

        size_t content_length = 0;
        try {
            content_length = std::stoul(length);
        } catch (const std::exception&) {
            send_response(client_fd, error_response(400, "Invalid Content-Length"));
            return;
        }

        expected_size = header_end + 4 + content_length;
        if (expected_size > MAX_REQUEST_SIZE) {
            send_response(client_fd, error_response(413, "Request too large"));
            return;
        }
    }

    if (request_data.empty()) return;

    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;

    send_response(client_fd, dispatch(req));
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) const {
    const HandlerFunc* handler = nullptr;

    auto exact = routes_.find(req.method + " " + req.path);
    if (exact != routes_.end()) {
        handler = &exact->second;
    } else {
        size_t best_length = 0;
        for (const auto& [pattern, candidate] : routes_) {
            size_t space_pos = pattern.find(' ');
            std::string method = pattern.substr(0, space_pos);
            std::string prefix = pattern.substr(space_pos + 1);

            if (method == req.method && req.path.compare(0, prefix.size(), prefix) == 0 &&
                prefix.size() > best_length) {
                handler = &candidate;
                best_length = prefix.size();
            }
        }
    }

    if (!handler) {
        return error_response(404, "Not found");
    }

    try {
        return (*handler)(req);
    } catch (const std::exception& e) {
        std::cerr << "[Server] " << req.method << " " << req.path
                  << " failed: " << e.what() << std::endl;
        return error_response(500, "Internal server error");
    }
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    size_t body_start = std::string::npos;
    if (header_end != std::string::npos) {
        body_start = header_end + 4;
    } else {
        header_end = raw.size();
    }

    std::istringstream stream(raw.substr(0, header_end));

    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);
    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        req.path = line.substr(space1 + 1, space2 - space1 - 1);
    }

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string key = line.substr(0, colon);
        size_t value_start = line.find_first_not_of(' ', colon + 1);
        req.headers[key] = value_start == std::string::npos ? "" : line.substr(value_start);
    }

    // Body kept byte-for-byte; uploads may be binary
    if (body_start != std::string::npos && body_start < raw.size()) {
        req.body = raw.substr(body_start);
    }

    return req;
}

const char* HttpServer::reason_phrase(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    out << "HTTP/1.1 " << resp.status_code << " " << reason_phrase(resp.status_code) << "\r\n";
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }
    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";
    out << resp.body;

    return out.str();
}

} // namespace scriptbox

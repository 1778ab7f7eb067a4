#include "http_server.h"
#include "constants.h"
#include "logger.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <json/json.h>

namespace runbox {

namespace {

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(tolower(c));
    return s;
}

void write_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_DEBUG("[HTTP] Client went away before response was sent: " +
                      std::string(std::strerror(errno)));
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

const char* status_text(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    std::string wanted = to_lower(name);
    for (const auto& [key, value] : headers) {
        if (to_lower(key) == wanted) return value;
    }
    return "";
}

HttpServer::HttpServer(int port) : port_(port), server_fd_(-1), running_(false) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = handler;
}

void HttpServer::start() {
    // Create socket
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    // Allow reuse
    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    // Bind
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port_);

    if (bind(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        throw std::runtime_error("Failed to bind to port " + std::to_string(port_));
    }

    // Listen
    if (listen(fd, LISTEN_BACKLOG) < 0) {
        close(fd);
        throw std::runtime_error("Failed to listen");
    }

    server_fd_ = fd;
    running_ = true;
    LOG_INFO("[HTTP] Server running on port " + std::to_string(port_));

    // Accept connections
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(fd, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (running_) continue;
            break;
        }

        // Get client IP
        char ip_buf[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip_buf, sizeof(ip_buf));
        std::string client_ip = ip_buf;

        // Bound how long a slow client can hold its thread
        struct timeval tv;
        tv.tv_sec = 30;
        tv.tv_usec = 0;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        {
            std::lock_guard<std::mutex> lock(active_mutex_);
            active_connections_++;
        }

        // Handle in new thread; no cap on concurrent jobs
        std::thread([this, client_fd, client_ip]() {
            handle_client(client_fd, client_ip);
            close(client_fd);

            std::lock_guard<std::mutex> lock(active_mutex_);
            active_connections_--;
            active_cv_.notify_all();
        }).detach();
    }

    close(fd);

    // In-flight jobs still own containers and workspaces; let them finish
    std::unique_lock<std::mutex> lock(active_mutex_);
    if (active_connections_ > 0) {
        LOG_INFO("[HTTP] Waiting for " + std::to_string(active_connections_) +
                 " in-flight request(s) to finish");
    }
    active_cv_.wait(lock, [this] { return active_connections_ == 0; });
    LOG_INFO("[HTTP] Server stopped");
}

size_t HttpServer::active_connections() const {
    std::lock_guard<std::mutex> lock(active_mutex_);
    return active_connections_;
}

void HttpServer::stop() {
    running_ = false;
    int fd = server_fd_.exchange(-1);
    if (fd >= 0) {
        // Wakes the blocked accept(); start() closes the descriptor
        shutdown(fd, SHUT_RDWR);
    }
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    // Read request with size limit
    std::string request_data;
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    ssize_t bytes_read;

    HttpResponse too_large;
    too_large.status_code = 413;
    too_large.body = error_body("Request exceeds " + std::to_string(MAX_REQUEST_SIZE / (1024 * 1024)) +
                                "MB limit");

    // Read request in chunks with size limit
    while ((bytes_read = read(client_fd, buffer, sizeof(buffer))) > 0) {
        if (request_data.size() + static_cast<size_t>(bytes_read) > MAX_REQUEST_SIZE) {
            write_all(client_fd, build_response(too_large));
            return;
        }
        request_data.append(buffer, bytes_read);

        // Check if we've received the complete headers
        size_t header_end = request_data.find("\r\n\r\n");
        if (header_end == std::string::npos) continue;

        HttpRequest head = parse_request(request_data.substr(0, header_end + 4));
        std::string length_str = head.header("Content-Length");
        if (length_str.empty()) {
            // No Content-Length, assume request is complete
            break;
        }

        size_t content_length = 0;
        try {
            content_length = std::stoul(length_str);
        } catch (const std::exception&) {
            HttpResponse bad;
            bad.status_code = 400;
            bad.body = error_body("Invalid Content-Length");
            write_all(client_fd, build_response(bad));
            return;
        }

        // Calculate expected total size
        size_t expected_size = header_end + 4 + content_length;
        if (expected_size > MAX_REQUEST_SIZE) {
            write_all(client_fd, build_response(too_large));
            return;
        }

        // Read remaining body if needed
        while (request_data.size() < expected_size) {
            bytes_read = read(client_fd, buffer,
                std::min(sizeof(buffer), expected_size - request_data.size()));
            if (bytes_read <= 0) break;
            request_data.append(buffer, bytes_read);
        }
        break;
    }

    if (request_data.empty()) return;

    // Parse request
    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;
    LOG_DEBUG("[HTTP] " + req.method + " " + req.path + " from " + client_ip);

    // Send response
    write_all(client_fd, build_response(dispatch(req)));
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) const {
    std::string path = req.path.substr(0, req.path.find('?'));

    HttpResponse resp;
    auto it = routes_.find(req.method + " " + path);
    if (it == routes_.end()) {
        resp.status_code = 404;
        resp.body = error_body("Not found");
        return resp;
    }

    try {
        resp = it->second(req);
    } catch (const std::exception& e) {
        LOG_ERROR("[HTTP] Unhandled error for " + req.method + " " + path + ": " + e.what());
        resp = HttpResponse();
        resp.status_code = 500;
        resp.body = error_body(e.what());
    }
    return resp;
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    std::string head = raw.substr(0, header_end);
    std::istringstream stream(head);

    // Parse request line
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);

    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        req.path = line.substr(space1 + 1, space2 - space1 - 1);
    }

    // Parse headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = line.substr(0, colon);
            size_t value_start = line.find_first_not_of(' ', colon + 1);
            std::string value = value_start == std::string::npos ? "" : line.substr(value_start);
            req.headers[key] = value;
        }
    }

    // Rest is body, byte for byte
    if (header_end != std::string::npos) {
        req.body = raw.substr(header_end + 4);
    }

    return req;
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    // Status line
    out << "HTTP/1.1 " << resp.status_code << " " << status_text(resp.status_code) << "\r\n";

    // Headers
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }

    // Content length
    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";

    // Body
    out << resp.body;

    return out.str();
}

std::string HttpServer::error_body(const std::string& message) {
    Json::Value body;
    body["error"] = message;
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, body);
}

} // namespace runbox

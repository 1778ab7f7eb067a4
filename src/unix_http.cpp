#include "unix_http.h"
#include "engine_client.h"
#include "constants.h"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <algorithm>

namespace runbox {

namespace {

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(tolower(c));
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::chrono::steady_clock::time_point deadline_after(std::chrono::milliseconds timeout) {
    return std::chrono::steady_clock::now() + timeout;
}

} // namespace

// ============================================================================
// UnixSocket
// ============================================================================

UnixSocket::UnixSocket(const std::string& path) : fd_(-1) {
    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        throw EngineError("Socket path too long: " + path);
    }
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        throw EngineError(errno_message("Failed to create socket"));
    }

    if (connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string message = errno_message("connect " + path);
        close(fd_);
        fd_ = -1;
        throw EngineError(message);
    }
}

UnixSocket::~UnixSocket() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

void UnixSocket::send_all(const std::string& data,
                          std::chrono::steady_clock::time_point deadline) {
    size_t sent = 0;
    while (sent < data.size()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            throw EngineTimeoutError("Timed out writing to engine");
        }

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, static_cast<int>(std::min<int64_t>(remaining.count(), 1000)));
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw EngineError(errno_message("poll"));
        }
        if (ready == 0) continue;

        ssize_t n = send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw EngineError(errno_message("send"));
        }
        sent += static_cast<size_t>(n);
    }
}

size_t UnixSocket::recv_some(char* buffer, size_t len,
                             std::chrono::steady_clock::time_point deadline) {
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            throw EngineTimeoutError("Timed out waiting for engine response");
        }

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, static_cast<int>(std::min<int64_t>(remaining.count(), 1000)));
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw EngineError(errno_message("poll"));
        }
        if (ready == 0) continue;

        ssize_t n = recv(fd_, buffer, len, 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw EngineError(errno_message("recv"));
        }
        return static_cast<size_t>(n);
    }
}

size_t UnixSocket::recv_blocking(char* buffer, size_t len) {
    while (true) {
        ssize_t n = recv(fd_, buffer, len, 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw EngineError(errno_message("recv"));
        }
        return static_cast<size_t>(n);
    }
}

void UnixSocket::shutdown_write() noexcept {
    if (fd_ >= 0) {
        shutdown(fd_, SHUT_WR);
    }
}

void UnixSocket::shutdown_both() noexcept {
    if (fd_ >= 0) {
        shutdown(fd_, SHUT_RDWR);
    }
}

// ============================================================================
// UnixHttpClient
// ============================================================================

UnixHttpClient::UnixHttpClient(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

std::string UnixHttpClient::build_request(const std::string& method,
                                          const std::string& path,
                                          const std::string& body,
                                          const std::map<std::string, std::string>& extra_headers) {
    std::ostringstream out;
    out << method << " " << path << " HTTP/1.1\r\n";
    out << "Host: docker\r\n";
    out << "User-Agent: runbox\r\n";

    bool has_connection = false;
    for (const auto& [key, value] : extra_headers) {
        out << key << ": " << value << "\r\n";
        if (to_lower(key) == "connection") has_connection = true;
    }
    if (!has_connection) {
        out << "Connection: close\r\n";
    }
    if (!body.empty()) {
        out << "Content-Type: application/json\r\n";
    }
    if (!body.empty() || method == "POST") {
        out << "Content-Length: " << body.size() << "\r\n";
    }
    out << "\r\n";
    out << body;
    return out.str();
}

EngineResponse UnixHttpClient::parse_head(const std::string& head) {
    EngineResponse resp;
    std::istringstream stream(head);
    std::string line;

    // Status line: HTTP/1.1 200 OK
    if (!std::getline(stream, line)) {
        throw EngineError("Empty response from engine");
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    if (line.compare(0, 5, "HTTP/") != 0 || space1 == std::string::npos) {
        throw EngineError("Malformed status line from engine: " + line);
    }
    size_t space2 = line.find(' ', space1 + 1);
    std::string code = line.substr(space1 + 1,
        space2 == std::string::npos ? std::string::npos : space2 - space1 - 1);
    try {
        resp.status_code = std::stoi(code);
    } catch (const std::exception&) {
        throw EngineError("Malformed status code from engine: " + code);
    }
    if (space2 != std::string::npos) {
        resp.reason = line.substr(space2 + 1);
    }

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            resp.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        }
    }
    return resp;
}

std::string UnixHttpClient::decode_chunked(const std::string& raw, bool& complete) {
    complete = false;
    std::string out;
    size_t pos = 0;

    while (pos < raw.size()) {
        size_t line_end = raw.find("\r\n", pos);
        if (line_end == std::string::npos) break;

        // Chunk extensions after ';' are ignored
        std::string size_field = raw.substr(pos, line_end - pos);
        size_t semi = size_field.find(';');
        if (semi != std::string::npos) size_field.resize(semi);
        size_field = trim(size_field);
        if (size_field.empty()) break;

        size_t chunk_size = 0;
        try {
            chunk_size = std::stoul(size_field, nullptr, 16);
        } catch (const std::exception&) {
            throw EngineError("Malformed chunk size from engine: " + size_field);
        }

        size_t data_start = line_end + 2;
        if (chunk_size == 0) {
            complete = true;
            break;
        }
        if (data_start + chunk_size + 2 > raw.size()) break;

        out.append(raw, data_start, chunk_size);
        pos = data_start + chunk_size + 2;
    }
    return out;
}

EngineResponse UnixHttpClient::request(const std::string& method,
                                       const std::string& path,
                                       const std::string& body,
                                       std::chrono::milliseconds timeout) const {
    auto deadline = deadline_after(timeout);
    UnixSocket sock(socket_path_);
    sock.send_all(build_request(method, path, body), deadline);

    std::string raw;
    raw.reserve(INITIAL_HTTP_BUFFER);
    char buffer[PIPE_BUFFER_SIZE];

    // Read through the end of the header block
    size_t head_end = std::string::npos;
    while ((head_end = raw.find("\r\n\r\n")) == std::string::npos) {
        size_t n = sock.recv_some(buffer, sizeof(buffer), deadline);
        if (n == 0) {
            throw EngineError("Engine closed connection before sending a response");
        }
        raw.append(buffer, n);
        if (raw.size() > MAX_ENGINE_RESPONSE_SIZE) {
            throw EngineError("Engine response head too large");
        }
    }

    EngineResponse resp = parse_head(raw.substr(0, head_end + 2));
    std::string rest = raw.substr(head_end + 4);

    auto te = resp.headers.find("transfer-encoding");
    auto cl = resp.headers.find("content-length");
    bool chunked = te != resp.headers.end() && to_lower(te->second).find("chunked") != std::string::npos;

    if (resp.status_code == 204 || resp.status_code == 304) {
        return resp;
    }

    if (chunked) {
        bool complete = false;
        resp.body = decode_chunked(rest, complete);
        while (!complete) {
            size_t n = sock.recv_some(buffer, sizeof(buffer), deadline);
            if (n == 0) break;
            rest.append(buffer, n);
            if (rest.size() > MAX_ENGINE_RESPONSE_SIZE) {
                throw EngineError("Engine response too large");
            }
            resp.body = decode_chunked(rest, complete);
        }
    } else if (cl != resp.headers.end()) {
        size_t expected = 0;
        try {
            expected = std::stoul(cl->second);
        } catch (const std::exception&) {
            throw EngineError("Malformed Content-Length from engine: " + cl->second);
        }
        if (expected > MAX_ENGINE_RESPONSE_SIZE) {
            throw EngineError("Engine response too large");
        }
        while (rest.size() < expected) {
            size_t n = sock.recv_some(buffer, std::min(sizeof(buffer), expected - rest.size()), deadline);
            if (n == 0) break;
            rest.append(buffer, n);
        }
        resp.body = rest.substr(0, expected);
    } else {
        // Connection: close delimits the body
        while (true) {
            size_t n = sock.recv_some(buffer, sizeof(buffer), deadline);
            if (n == 0) break;
            rest.append(buffer, n);
            if (rest.size() > MAX_ENGINE_RESPONSE_SIZE) {
                throw EngineError("Engine response too large");
            }
        }
        resp.body = rest;
    }
    return resp;
}

std::unique_ptr<UnixSocket> UnixHttpClient::upgrade(const std::string& path,
                                                    std::string& leftover,
                                                    std::chrono::milliseconds timeout) const {
    auto deadline = deadline_after(timeout);
    auto sock = std::make_unique<UnixSocket>(socket_path_);
    sock->send_all(build_request("POST", path, "", {
        {"Connection", "Upgrade"},
        {"Upgrade", "tcp"},
    }), deadline);

    std::string raw;
    char buffer[PIPE_BUFFER_SIZE];
    size_t head_end = std::string::npos;
    while ((head_end = raw.find("\r\n\r\n")) == std::string::npos) {
        size_t n = sock->recv_some(buffer, sizeof(buffer), deadline);
        if (n == 0) {
            throw EngineError("Engine closed connection during attach");
        }
        raw.append(buffer, n);
        if (raw.size() > MAX_ENGINE_RESPONSE_SIZE) {
            throw EngineError("Engine attach response too large");
        }
    }

    EngineResponse resp = parse_head(raw.substr(0, head_end + 2));
    // 101 on upgrade-aware engines, 200 on older ones
    if (resp.status_code != 101 && resp.status_code != 200) {
        std::string body = raw.substr(head_end + 4);
        throw EngineError("Attach failed (" + std::to_string(resp.status_code) + "): " + body,
                          resp.status_code);
    }

    leftover = raw.substr(head_end + 4);
    return sock;
}

} // namespace runbox

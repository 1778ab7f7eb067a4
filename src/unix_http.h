#pragma once

#include <string>
#include <map>
#include <chrono>
#include <memory>

namespace runbox {

// Connected AF_UNIX stream socket (RAII)
class UnixSocket {
public:
    // Connect to `path`. Throws EngineError.
    explicit UnixSocket(const std::string& path);
    ~UnixSocket();

    UnixSocket(const UnixSocket&) = delete;
    UnixSocket& operator=(const UnixSocket&) = delete;

    int fd() const { return fd_; }

    // Write the whole buffer before `deadline`. Throws EngineTimeoutError / EngineError.
    void send_all(const std::string& data, std::chrono::steady_clock::time_point deadline);

    // Read up to `len` bytes, waiting at most until `deadline`.
    // Returns 0 on EOF. Throws EngineTimeoutError / EngineError.
    size_t recv_some(char* buffer, size_t len, std::chrono::steady_clock::time_point deadline);

    // Blocking read with no deadline. Returns 0 on EOF.
    size_t recv_blocking(char* buffer, size_t len);

    void shutdown_write() noexcept;
    void shutdown_both() noexcept;

private:
    int fd_;
};

// Response of a request made through UnixHttpClient
struct EngineResponse {
    int status_code = 0;
    std::string reason;
    std::map<std::string, std::string> headers;  // Lower-cased names
    std::string body;                            // De-chunked

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Minimal HTTP/1.1 client for an API served on a Unix socket.
// One connection per request; no shared state between calls.
class UnixHttpClient {
public:
    explicit UnixHttpClient(std::string socket_path);

    // Send a request and read the full response before `timeout` elapses
    EngineResponse request(const std::string& method,
                           const std::string& path,
                           const std::string& body,
                           std::chrono::milliseconds timeout) const;

    // Send an upgrade request and keep the connection as a raw duplex stream.
    // `leftover` receives stream bytes read past the response head.
    std::unique_ptr<UnixSocket> upgrade(const std::string& path,
                                        std::string& leftover,
                                        std::chrono::milliseconds timeout) const;

    const std::string& socket_path() const { return socket_path_; }

    // Wire helpers (exposed for tests)
    static std::string build_request(const std::string& method,
                                     const std::string& path,
                                     const std::string& body,
                                     const std::map<std::string, std::string>& extra_headers = {});

    // Parse status line and headers (without the terminating blank line)
    static EngineResponse parse_head(const std::string& head);

    // Decode a chunked body. `complete` is set when the terminating
    // zero-size chunk has been seen.
    static std::string decode_chunked(const std::string& raw, bool& complete);

private:
    std::string socket_path_;
};

} // namespace runbox

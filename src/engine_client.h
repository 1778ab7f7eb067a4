#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <cstdint>
#include <stdexcept>

namespace runbox {

// Failure reported by (or while talking to) the container engine.
// status_code is the engine's HTTP status, or 0 for transport errors.
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& message, int status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

// A bounded engine call ran past its deadline
class EngineTimeoutError : public EngineError {
public:
    explicit EngineTimeoutError(const std::string& message)
        : EngineError(message, 0) {}
};

// Everything needed to create one job container
struct ContainerSpec {
    std::string image;
    std::vector<std::string> command;      // Entrypoint argv
    std::string working_dir;
    std::vector<std::string> binds;        // "host:container[:mode]"
    int64_t memory_bytes = 0;
    int64_t cpu_period_us = 0;
    int64_t cpu_quota_us = 0;
    bool open_stdin = true;
};

struct WaitResult {
    int64_t status_code = 0;
    std::string error;                     // Engine-reported wait error, if any
};

// Duplex byte channel attached to a container's stdio.
// Reads return multiplexed frames (see StreamDemuxer).
class AttachStream {
public:
    virtual ~AttachStream() = default;

    // Blocking read. Returns 0 at end of stream. Throws EngineError.
    virtual size_t read(char* buffer, size_t len) = 0;

    // Write to the container's stdin within `timeout`.
    // Throws EngineTimeoutError / EngineError.
    virtual void write(const std::string& data, std::chrono::milliseconds timeout) = 0;

    // Half-close: the container sees EOF on stdin
    virtual void close_write() noexcept = 0;

    // Tear the channel down; a blocked read() returns promptly
    virtual void close() noexcept = 0;
};

// Operations the orchestrator needs from the container engine.
// Implementations must be safe to call from multiple threads.
class EngineClient {
public:
    virtual ~EngineClient() = default;

    // Liveness probe. Throws EngineError.
    virtual void ping() = 0;

    // Returns the new container id
    virtual std::string create_container(const ContainerSpec& spec) = 0;

    virtual void start_container(const std::string& id) = 0;

    virtual std::unique_ptr<AttachStream> attach_container(const std::string& id) = 0;

    // Block until the container is not running.
    // Throws EngineTimeoutError when `timeout` elapses first.
    virtual WaitResult wait_container(const std::string& id, std::chrono::milliseconds timeout) = 0;

    // Container State object as JSON text
    virtual std::string inspect_state(const std::string& id) = 0;

    // Buffered logs so far, multiplexed
    virtual std::string container_logs(const std::string& id) = 0;

    virtual void remove_container(const std::string& id, bool force) = 0;
};

} // namespace runbox

#pragma once

#include <cstddef>  // for size_t
#include <cstdint>
#include <chrono>

namespace runbox {

// Container resource caps
constexpr int64_t CONTAINER_MEMORY_LIMIT_BYTES = 1536LL * 1024 * 1024;  // 1.5GB
constexpr int64_t CONTAINER_CPU_PERIOD_US = 100000;                      // 100ms period
constexpr int64_t CONTAINER_CPU_QUOTA_US = 150000;                       // 150% of one core
constexpr const char* CONTAINER_WORKDIR = "/app";

// Time limits
constexpr int DEFAULT_TIMEOUT_SECONDS = 15;                       // Most languages
constexpr int SLOW_START_TIMEOUT_SECONDS = 60;                    // Heavy runtimes (node, dotnet)
constexpr auto DRAIN_GRACE_PERIOD = std::chrono::seconds(5);      // Wait for attach EOF after exit
constexpr auto ENGINE_IO_TIMEOUT = std::chrono::seconds(30);      // Plain Docker API calls

// Engine connection
constexpr int MAX_CONNECT_ATTEMPTS = 5;
constexpr auto CONNECT_RETRY_DELAY = std::chrono::seconds(2);
constexpr const char* DEFAULT_DOCKER_SOCKET = "/var/run/docker.sock";
constexpr const char* DOCKER_API_VERSION = "/v1.41";

// Multiplexed attach stream: 1 byte type, 3 reserved, 4 byte big-endian length
constexpr size_t DEMUX_HEADER_SIZE = 8;

// Workspace
constexpr const char* INPUT_FILE_NAME = "input.txt";

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                        // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                     // Initial HTTP buffer
constexpr size_t MAX_REQUEST_SIZE = 10 * 1024 * 1024;            // 10MB max request
constexpr size_t MAX_OUTPUT_SIZE = 10 * 1024 * 1024;             // 10MB per output stream
constexpr size_t MAX_ENGINE_RESPONSE_SIZE = 64 * 1024 * 1024;    // Cap on buffered Docker replies

// Network
constexpr int DEFAULT_PORT = 3000;                               // Default server port
constexpr int LISTEN_BACKLOG = 128;                              // Socket listen backlog

// Logging
constexpr int LOG_RETENTION_FILES = 7;                           // Keep 7 daily log files
constexpr uintmax_t LOG_MAX_FILE_BYTES = 10 * 1024 * 1024;       // Roll over within a day at 10MB

} // namespace runbox

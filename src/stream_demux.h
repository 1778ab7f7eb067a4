#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include "constants.h"

namespace runbox {

// Stream selector byte in a multiplexed frame header
enum class StreamType : uint8_t {
    STDIN = 0,
    STDOUT = 1,
    STDERR = 2
};

// Incremental decoder for Docker's multiplexed attach/logs stream.
//
// Each frame is an 8-byte header [type, 0, 0, 0, len(4, big-endian)]
// followed by `len` payload bytes. Input may be fed in arbitrary chunks;
// headers and payloads can straddle chunk boundaries. Payload bytes are
// appended in order to stdout (types 0 and 1) or stderr (type 2), up to
// `max_stream_bytes` per stream; anything past the cap is counted and dropped.
class StreamDemuxer {
public:
    explicit StreamDemuxer(size_t max_stream_bytes = MAX_OUTPUT_SIZE)
        : max_stream_bytes_(max_stream_bytes) {}

    // Consume the next chunk of the channel
    void feed(const char* data, size_t len);
    void feed(const std::string& chunk) { feed(chunk.data(), chunk.size()); }

    // Signal end of channel. Returns the number of bytes belonging to an
    // incomplete trailing frame (header or payload); those are dropped.
    size_t finish();

    const std::string& stdout_data() const { return stdout_; }
    const std::string& stderr_data() const { return stderr_; }

    // Move accumulated buffers out
    std::string take_stdout() { return std::move(stdout_); }
    std::string take_stderr() { return std::move(stderr_); }

    size_t frames_decoded() const { return frames_; }
    size_t dropped_bytes() const { return dropped_; }

    // Encode one frame (used to build synthetic streams)
    static std::string encode_frame(StreamType type, const std::string& payload);

    // Demultiplex a complete buffer in one call
    static void split(const std::string& raw, std::string& out, std::string& err);

    // Decode bytes as UTF-8, replacing each ill-formed subsequence with U+FFFD
    static std::string to_valid_utf8(const std::string& bytes);

private:
    void append_payload(const char* data, size_t len);

    uint8_t header_[8] = {0};
    size_t header_filled_ = 0;
    StreamType current_type_ = StreamType::STDOUT;
    size_t payload_remaining_ = 0;
    bool in_payload_ = false;
    size_t current_payload_read_ = 0;

    size_t max_stream_bytes_;
    std::string stdout_;
    std::string stderr_;
    size_t frames_ = 0;
    size_t dropped_ = 0;
};

} // namespace runbox

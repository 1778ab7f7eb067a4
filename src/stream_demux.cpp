#include "stream_demux.h"
#include "constants.h"
#include <algorithm>

namespace runbox {

void StreamDemuxer::append_payload(const char* data, size_t len) {
    std::string& target = current_type_ == StreamType::STDERR ? stderr_ : stdout_;
    size_t room = target.size() < max_stream_bytes_ ? max_stream_bytes_ - target.size() : 0;
    size_t keep = std::min(room, len);
    target.append(data, keep);
    dropped_ += len - keep;
}

void StreamDemuxer::feed(const char* data, size_t len) {
    size_t pos = 0;

    while (pos < len) {
        if (!in_payload_) {
            // Accumulate header bytes
            size_t need = DEMUX_HEADER_SIZE - header_filled_;
            size_t take = std::min(need, len - pos);
            std::copy(data + pos, data + pos + take, header_ + header_filled_);
            header_filled_ += take;
            pos += take;

            if (header_filled_ < DEMUX_HEADER_SIZE) {
                break;
            }

            // Unknown selectors go to stdout, like the stdin echo
            current_type_ = header_[0] == static_cast<uint8_t>(StreamType::STDERR)
                ? StreamType::STDERR : StreamType::STDOUT;
            payload_remaining_ = (static_cast<size_t>(header_[4]) << 24) |
                                 (static_cast<size_t>(header_[5]) << 16) |
                                 (static_cast<size_t>(header_[6]) << 8) |
                                 static_cast<size_t>(header_[7]);
            header_filled_ = 0;
            current_payload_read_ = 0;

            if (payload_remaining_ == 0) {
                frames_++;
                continue;
            }
            in_payload_ = true;
        }

        size_t take = std::min(payload_remaining_, len - pos);
        append_payload(data + pos, take);
        pos += take;
        payload_remaining_ -= take;
        current_payload_read_ += take;

        if (payload_remaining_ == 0) {
            in_payload_ = false;
            frames_++;
        }
    }
}

size_t StreamDemuxer::finish() {
    size_t dangling = header_filled_;
    if (in_payload_) {
        // Bytes of a truncated payload were already delivered; keep them
        dangling = DEMUX_HEADER_SIZE + current_payload_read_;
    }
    header_filled_ = 0;
    in_payload_ = false;
    payload_remaining_ = 0;
    current_payload_read_ = 0;
    return dangling;
}

std::string StreamDemuxer::encode_frame(StreamType type, const std::string& payload) {
    std::string frame;
    frame.reserve(DEMUX_HEADER_SIZE + payload.size());

    uint32_t len = static_cast<uint32_t>(payload.size());
    frame.push_back(static_cast<char>(type));
    frame.push_back('\0');
    frame.push_back('\0');
    frame.push_back('\0');
    frame.push_back(static_cast<char>((len >> 24) & 0xFF));
    frame.push_back(static_cast<char>((len >> 16) & 0xFF));
    frame.push_back(static_cast<char>((len >> 8) & 0xFF));
    frame.push_back(static_cast<char>(len & 0xFF));
    frame += payload;
    return frame;
}

void StreamDemuxer::split(const std::string& raw, std::string& out, std::string& err) {
    StreamDemuxer demux;
    demux.feed(raw);
    demux.finish();
    out = demux.take_stdout();
    err = demux.take_stderr();
}

std::string StreamDemuxer::to_valid_utf8(const std::string& bytes) {
    static const char kReplacement[] = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        unsigned char lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
            i++;
            continue;
        }

        // Sequence length and the allowed range of the second byte
        size_t len = 0;
        unsigned char low = 0x80, high = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            len = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            len = 3;
            if (lead == 0xE0) low = 0xA0;        // Overlong
            if (lead == 0xED) high = 0x9F;       // Surrogates
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            len = 4;
            if (lead == 0xF0) low = 0x90;        // Overlong
            if (lead == 0xF4) high = 0x8F;       // Above U+10FFFF
        } else {
            out += kReplacement;
            i++;
            continue;
        }

        // One replacement per maximal ill-formed prefix, resuming at the offending byte
        size_t matched = 1;
        while (matched < len && i + matched < bytes.size()) {
            unsigned char b = static_cast<unsigned char>(bytes[i + matched]);
            unsigned char lo = matched == 1 ? low : 0x80;
            unsigned char hi = matched == 1 ? high : 0xBF;
            if (b < lo || b > hi) break;
            matched++;
        }

        if (matched == len) {
            out.append(bytes, i, len);
        } else {
            out += kReplacement;
        }
        i += matched;
    }
    return out;
}

} // namespace runbox

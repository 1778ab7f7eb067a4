#include <gtest/gtest.h>
#include "stream_demux.h"
#include <random>

namespace runbox {
namespace {

std::string frame(StreamType type, const std::string& payload) {
    return StreamDemuxer::encode_frame(type, payload);
}

TEST(StreamDemuxTest, EncodesHeaderWithBigEndianLength) {
    std::string encoded = frame(StreamType::STDERR, std::string(258, 'x'));

    ASSERT_EQ(encoded.size(), 8u + 258u);
    EXPECT_EQ(encoded[0], '\x02');
    EXPECT_EQ(encoded[1], '\0');
    EXPECT_EQ(encoded[2], '\0');
    EXPECT_EQ(encoded[3], '\0');
    EXPECT_EQ(encoded[4], '\0');
    EXPECT_EQ(encoded[5], '\0');
    EXPECT_EQ(encoded[6], '\x01');
    EXPECT_EQ(encoded[7], '\x02');
}

TEST(StreamDemuxTest, RoutesInterleavedFramesInOrder) {
    // Given: stdout and stderr frames interleaved on one channel
    std::string raw = frame(StreamType::STDOUT, "a") +
                      frame(StreamType::STDERR, "X") +
                      frame(StreamType::STDOUT, "b") +
                      frame(StreamType::STDERR, "Y");

    // When: Demultiplexed
    StreamDemuxer demux;
    demux.feed(raw);

    // Then: Each stream keeps its own byte order
    EXPECT_EQ(demux.stdout_data(), "ab");
    EXPECT_EQ(demux.stderr_data(), "XY");
    EXPECT_EQ(demux.frames_decoded(), 4u);
    EXPECT_EQ(demux.finish(), 0u);
}

TEST(StreamDemuxTest, StdinSelectorGoesToStdout) {
    StreamDemuxer demux;
    demux.feed(frame(StreamType::STDIN, "echo"));

    EXPECT_EQ(demux.stdout_data(), "echo");
    EXPECT_TRUE(demux.stderr_data().empty());
}

TEST(StreamDemuxTest, HandlesOneByteChunks) {
    // Given: A channel delivered one byte at a time
    std::string raw = frame(StreamType::STDOUT, "Hello, ") +
                      frame(StreamType::STDERR, "warn\n") +
                      frame(StreamType::STDOUT, "World!\n");

    StreamDemuxer demux;
    for (char c : raw) {
        demux.feed(&c, 1);
    }

    // Then: Headers split across chunks are reassembled
    EXPECT_EQ(demux.stdout_data(), "Hello, World!\n");
    EXPECT_EQ(demux.stderr_data(), "warn\n");
    EXPECT_EQ(demux.finish(), 0u);
}

TEST(StreamDemuxTest, ArbitraryChunkingGivesSameResult) {
    // Given: A stream with frames of many sizes
    std::string raw;
    std::string expected_out;
    std::string expected_err;
    for (int i = 0; i < 50; i++) {
        std::string payload(static_cast<size_t>(i * 7 % 61), static_cast<char>('a' + i % 26));
        if (i % 3 == 0) {
            raw += frame(StreamType::STDERR, payload);
            expected_err += payload;
        } else {
            raw += frame(StreamType::STDOUT, payload);
            expected_out += payload;
        }
    }

    // When: Fed in random-sized chunks
    std::mt19937 rng(42);
    std::uniform_int_distribution<size_t> chunk(1, 37);
    StreamDemuxer demux;
    size_t pos = 0;
    while (pos < raw.size()) {
        size_t n = std::min(chunk(rng), raw.size() - pos);
        demux.feed(raw.data() + pos, n);
        pos += n;
    }

    // Then: Chunk boundaries make no difference
    EXPECT_EQ(demux.stdout_data(), expected_out);
    EXPECT_EQ(demux.stderr_data(), expected_err);
    EXPECT_EQ(demux.frames_decoded(), 50u);
    EXPECT_EQ(demux.finish(), 0u);
}

TEST(StreamDemuxTest, ZeroLengthFrameIsSkipped) {
    StreamDemuxer demux;
    demux.feed(frame(StreamType::STDOUT, "") + frame(StreamType::STDOUT, "x"));

    EXPECT_EQ(demux.stdout_data(), "x");
    EXPECT_EQ(demux.frames_decoded(), 2u);
}

TEST(StreamDemuxTest, BinaryPayloadPassesThrough) {
    std::string payload("\0\xff\x01\n", 4);
    StreamDemuxer demux;
    demux.feed(frame(StreamType::STDOUT, payload));

    EXPECT_EQ(demux.stdout_data(), payload);
}

TEST(StreamDemuxTest, TruncatedHeaderIsReportedAtFinish) {
    // Given: One complete frame followed by 3 header bytes
    std::string raw = frame(StreamType::STDOUT, "ok") + std::string("\x01\0\0", 3);

    StreamDemuxer demux;
    demux.feed(raw);

    // Then: Complete data is kept, the partial header is reported
    EXPECT_EQ(demux.stdout_data(), "ok");
    EXPECT_EQ(demux.finish(), 3u);
}

TEST(StreamDemuxTest, TruncatedPayloadKeepsDeliveredBytes) {
    // Given: A frame announcing 10 bytes of which only 4 arrive
    std::string raw = frame(StreamType::STDERR, "0123456789").substr(0, 8 + 4);

    StreamDemuxer demux;
    demux.feed(raw);

    EXPECT_EQ(demux.stderr_data(), "0123");
    EXPECT_EQ(demux.finish(), 12u);
    EXPECT_EQ(demux.frames_decoded(), 0u);
}

TEST(StreamDemuxTest, TakeMovesBuffersOut) {
    StreamDemuxer demux;
    demux.feed(frame(StreamType::STDOUT, "out") + frame(StreamType::STDERR, "err"));

    EXPECT_EQ(demux.take_stdout(), "out");
    EXPECT_EQ(demux.take_stderr(), "err");
}

TEST(StreamDemuxTest, SplitDecodesWholeBuffer) {
    std::string out, err;
    StreamDemuxer::split(frame(StreamType::STDOUT, "1") + frame(StreamType::STDERR, "2"), out, err);

    EXPECT_EQ(out, "1");
    EXPECT_EQ(err, "2");
}

TEST(StreamDemuxTest, EmptyChannelYieldsEmptyStreams) {
    std::string out, err;
    StreamDemuxer::split("", out, err);

    EXPECT_TRUE(out.empty());
    EXPECT_TRUE(err.empty());
}

// ============================================================================
// Output cap
// ============================================================================

TEST(StreamDemuxTest, CapsEachStreamAndCountsDropped) {
    // Given: A cap of 4 bytes per stream
    StreamDemuxer demux(4);

    // When: Both streams overflow it across several frames
    demux.feed(frame(StreamType::STDOUT, "abc") + frame(StreamType::STDERR, "XY") +
               frame(StreamType::STDOUT, "defg") + frame(StreamType::STDERR, "Z"));

    // Then: Each stream keeps its first bytes and the rest is counted
    EXPECT_EQ(demux.stdout_data(), "abcd");
    EXPECT_EQ(demux.stderr_data(), "XYZ");
    EXPECT_EQ(demux.dropped_bytes(), 3u);
    EXPECT_EQ(demux.frames_decoded(), 4u);
}

// ============================================================================
// UTF-8 decoding
// ============================================================================

TEST(StreamDemuxTest, ValidUtf8PassesThrough) {
    std::string text = "h\xc3\xa9llo \xe4\xb8\x96\xe7\x95\x8c \xf0\x9f\x98\x80\n";

    EXPECT_EQ(StreamDemuxer::to_valid_utf8(text), text);
    EXPECT_EQ(StreamDemuxer::to_valid_utf8(""), "");
}

TEST(StreamDemuxTest, InvalidBytesBecomeReplacementCharacters) {
    const std::string fffd = "\xef\xbf\xbd";

    // Stray bytes that can never start a sequence
    EXPECT_EQ(StreamDemuxer::to_valid_utf8("ok\xff\xfe\n"), "ok" + fffd + fffd + "\n");
    // Sequence cut off by the end of output
    EXPECT_EQ(StreamDemuxer::to_valid_utf8("ab\xe4\xb8"), "ab" + fffd);
    // Sequence interrupted by ASCII
    EXPECT_EQ(StreamDemuxer::to_valid_utf8("\xe4\xb8x"), fffd + "x");
    // Overlong encoding of '/'
    EXPECT_EQ(StreamDemuxer::to_valid_utf8("\xc0\xaf"), fffd + fffd);
    // UTF-16 surrogate
    EXPECT_EQ(StreamDemuxer::to_valid_utf8("\xed\xa0\x80"), fffd + fffd + fffd);
}

} // namespace
} // namespace runbox

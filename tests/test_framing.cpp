// tests/test_framing.cpp
#include <catch2/catch_test_macros.hpp>
#include "common/utils/framing.h"
#include <unistd.h>

using namespace loom;

TEST_CASE("Decoder handles split frames", "[framing]") {
    std::string bytes = encode_frame({{"type", "result"}, {"n", 1}}) + encode_frame({{"type", "error"}});
    FrameDecoder decoder(1024);
    nlohmann::json frame;

    decoder.feed(bytes.data(), 3);
    REQUIRE(decoder.next(frame) == FrameStatus::NEED_MORE);
    decoder.feed(bytes.data() + 3, bytes.size() - 3);
    REQUIRE(decoder.next(frame) == FrameStatus::OK);
    REQUIRE(frame["type"] == "result");
    REQUIRE(decoder.next(frame) == FrameStatus::OK);
    REQUIRE(frame["type"] == "error");
    REQUIRE(decoder.next(frame) == FrameStatus::NEED_MORE);
    REQUIRE_FALSE(decoder.has_partial());
}

TEST_CASE("Oversized and malformed frames", "[framing]") {
    nlohmann::json frame;
    SECTION("declared length above the ceiling") {
        std::string big = encode_frame({{"type", "x"}, {"pad", std::string(100, 'p')}});
        FrameDecoder decoder(16);
        decoder.feed(big.data(), big.size());
        REQUIRE(decoder.next(frame) == FrameStatus::TOO_LARGE);
    }
    SECTION("payload without a type") {
        std::string bad = encode_frame({{"kind", "x"}});
        FrameDecoder decoder(1024);
        decoder.feed(bad.data(), bad.size());
        REQUIRE(decoder.next(frame) == FrameStatus::MALFORMED);
    }
    SECTION("payload that is not JSON") {
        std::string raw = "not json";
        std::string bytes;
        uint32_t n = static_cast<uint32_t>(raw.size());
        bytes.push_back(static_cast<char>((n >> 24) & 0xff));
        bytes.push_back(static_cast<char>((n >> 16) & 0xff));
        bytes.push_back(static_cast<char>((n >> 8) & 0xff));
        bytes.push_back(static_cast<char>(n & 0xff));
        bytes += raw;
        FrameDecoder decoder(1024);
        decoder.feed(bytes.data(), bytes.size());
        REQUIRE(decoder.next(frame) == FrameStatus::MALFORMED);
    }
}

TEST_CASE("Frames over a pipe", "[framing]") {
    int fds[2];
    REQUIRE(pipe(fds) == 0);
    REQUIRE(write_frame(fds[1], {{"type", "tool_call"}, {"id", 1}}));
    close(fds[1]);
    auto frame = read_frame(fds[0], 1024);
    REQUIRE(frame);
    REQUIRE((*frame)["id"] == 1);
    REQUIRE_FALSE(read_frame(fds[0], 1024));
    close(fds[0]);
}

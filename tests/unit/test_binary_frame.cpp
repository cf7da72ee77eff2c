#include <catch2/catch_test_macros.hpp>
#include "network/binary_frame.hpp"

using namespace tandem;
using namespace tandem::network;

TEST_CASE("Frame header is eight little-endian bytes", "[frame]") {
    const Bytes payload{0xAA, 0xBB};
    auto frame = serializeFrame(FrameHeader{.stream_index = 0x01020304, .frame_index = 7},
                                payload.data(), payload.size());

    REQUIRE(frame.size() == FrameHeader::HEADER_SIZE + 2);
    REQUIRE(frame[0] == 0x04);
    REQUIRE(frame[1] == 0x03);
    REQUIRE(frame[2] == 0x02);
    REQUIRE(frame[3] == 0x01);
    REQUIRE(frame[4] == 7);
    REQUIRE(frame[5] == 0);
    REQUIRE(frame[8] == 0xAA);
    REQUIRE(frame[9] == 0xBB);
}

TEST_CASE("parseFrame splits header and payload", "[frame]") {
    const Bytes payload{1, 2, 3, 4, 5};
    auto raw = serializeFrame(FrameHeader{.stream_index = 3, .frame_index = 41},
                              payload.data(), payload.size());

    auto parsed = parseFrame(raw);
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap().header.stream_index == 3);
    REQUIRE(parsed.unwrap().header.frame_index == 41);
    REQUIRE(parsed.unwrap().payload == payload);

    SECTION("header-only frame has an empty payload") {
        auto empty = parseFrame(serializeFrame(FrameHeader{}, nullptr, 0));
        REQUIRE(empty.is_ok());
        REQUIRE(empty.unwrap().payload.empty());
    }

    SECTION("shorter than the header is rejected") {
        REQUIRE(parseFrame(Bytes{1, 2, 3}).is_err());
        REQUIRE(parseFrame(Bytes{}).is_err());
    }
}

TEST_CASE("frameCount rounds up and is zero for empty payloads", "[frame]") {
    REQUIRE(frameCount(0, 16384) == 0);
    REQUIRE(frameCount(1, 16384) == 1);
    REQUIRE(frameCount(16384, 16384) == 1);
    REQUIRE(frameCount(16385, 16384) == 2);
    REQUIRE(frameCount(50000, 16384) == 4);
    REQUIRE(frameCount(3 * 16384, 16384) == 3);
    static_assert(frameCount(10, 4) == 3);
}

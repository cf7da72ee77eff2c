#include "network/binary_frame.hpp"

#include <algorithm>
#include <string>

namespace tandem::network {

namespace {

void write_u32_le(uint8_t* dst, uint32_t value) {
    dst[0] = static_cast<uint8_t>(value & 0xFF);
    dst[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    dst[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    dst[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

uint32_t read_u32_le(const uint8_t* src) {
    return static_cast<uint32_t>(src[0]) |
           (static_cast<uint32_t>(src[1]) << 8) |
           (static_cast<uint32_t>(src[2]) << 16) |
           (static_cast<uint32_t>(src[3]) << 24);
}

} // namespace

Bytes serializeFrame(const FrameHeader& header, const uint8_t* data, size_t size) {
    Bytes out(FrameHeader::HEADER_SIZE + size);
    write_u32_le(out.data(), header.stream_index);
    write_u32_le(out.data() + 4, header.frame_index);
    if (size > 0) {
        std::copy(data, data + size, out.begin() + FrameHeader::HEADER_SIZE);
    }
    return out;
}

Result<BinaryFrame> parseFrame(const Bytes& raw) {
    if (raw.size() < FrameHeader::HEADER_SIZE) {
        return fail<BinaryFrame>(ErrorCode::Transfer,
                                 "Frame too short: " + std::to_string(raw.size()) + " bytes");
    }

    BinaryFrame frame;
    frame.header.stream_index = read_u32_le(raw.data());
    frame.header.frame_index = read_u32_le(raw.data() + 4);
    frame.payload.assign(raw.begin() + FrameHeader::HEADER_SIZE, raw.end());
    return Result<BinaryFrame>::ok(std::move(frame));
}

} // namespace tandem::network

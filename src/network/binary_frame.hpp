#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <cstdint>

namespace tandem::network {

/**
 * Bulk-channel frame header.
 *
 * Format:
 * - Stream index (4 bytes, little-endian)
 * - Frame index (4 bytes, little-endian)
 * - Payload (variable)
 */
struct FrameHeader {
    static constexpr size_t HEADER_SIZE = 8;

    uint32_t stream_index = 0;
    uint32_t frame_index = 0;
};

/**
 * A parsed frame; payload excludes the header.
 */
struct BinaryFrame {
    FrameHeader header;
    Bytes payload;
};

/**
 * Build a frame from a header and a slice of payload bytes.
 */
[[nodiscard]] Bytes serializeFrame(const FrameHeader& header, const uint8_t* data, size_t size);

/**
 * Split raw bulk-channel bytes into header and payload.
 * Fails when shorter than the header.
 */
[[nodiscard]] Result<BinaryFrame> parseFrame(const Bytes& raw);

/**
 * Number of frames for a payload; zero for an empty payload.
 */
[[nodiscard]] constexpr uint32_t frameCount(uint64_t size, size_t frame_size) noexcept {
    if (size == 0 || frame_size == 0) return 0;
    return static_cast<uint32_t>((size + frame_size - 1) / frame_size);
}

} // namespace tandem::network

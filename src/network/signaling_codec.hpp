#pragma once

#include "core/result.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace tandem::network {

enum class DescriptorKind {
    Offer,
    Answer
};

[[nodiscard]] std::string_view descriptorKindName(DescriptorKind kind) noexcept;
[[nodiscard]] std::optional<DescriptorKind> descriptorKindFromName(std::string_view name) noexcept;

/**
 * ConnectionDescriptor - one side of the handshake (SDP offer or answer),
 * exchanged out-of-band. Never persisted.
 */
struct ConnectionDescriptor {
    DescriptorKind kind = DescriptorKind::Offer;
    std::string payload;

    bool operator==(const ConnectionDescriptor&) const = default;
};

/**
 * Encode a descriptor as a compact, URL-safe code.
 *
 * Format: base64url(deflate(`{"t":kind,"s":payload}`)) without padding.
 * Fails when the payload is empty.
 */
[[nodiscard]] Result<std::string> encodeDescriptor(const ConnectionDescriptor& descriptor);

/**
 * Decode a code produced by encodeDescriptor().
 *
 * Surrounding whitespace is ignored. Truncated or corrupted input, invalid
 * JSON and unknown kinds fail with ErrorCode::Signaling.
 */
[[nodiscard]] Result<ConnectionDescriptor> decodeDescriptor(std::string_view code);

/**
 * Cheap structural check: non-empty payload carrying the SDP version line.
 */
[[nodiscard]] bool validateDescriptor(const ConnectionDescriptor& descriptor);

} // namespace tandem::network

#include "core/types.hpp"
#include "core/result.hpp"

#include <cstring>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace tandem {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::Signaling: return "signaling";
        case ErrorCode::Negotiation: return "negotiation";
        case ErrorCode::Transfer: return "transfer";
        case ErrorCode::ProtocolViolation: return "protocol_violation";
        case ErrorCode::LivenessTimeout: return "liveness_timeout";
        case ErrorCode::ReceiverRejection: return "receiver_rejection";
        case ErrorCode::InvalidState: return "invalid_state";
        case ErrorCode::ReadOnly: return "read_only";
        case ErrorCode::Storage: return "storage";
    }
    return "unknown";
}

Uuid Uuid::generate() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dist;

    Storage bytes;
    const uint64_t hi = dist(gen);
    const uint64_t lo = dist(gen);
    std::memcpy(bytes.data(), &hi, sizeof(hi));
    std::memcpy(bytes.data() + sizeof(hi), &lo, sizeof(lo));

    bytes[6] = (bytes[6] & 0x0F) | 0x40;  // version 4
    bytes[8] = (bytes[8] & 0x3F) | 0x80;  // RFC 4122 variant
    return Uuid(bytes);
}

std::optional<Uuid> Uuid::parse(std::string_view str) {
    std::string clean;
    clean.reserve(32);
    for (char c : str) {
        if (c != '-') clean += c;
    }
    if (clean.size() != 32) return std::nullopt;

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    Storage bytes;
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        const int hi = nibble(clean[i * 2]);
        const int lo = nibble(clean[i * 2 + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes_[i]);
    }
    return oss.str();
}

Timestamp Timestamp::now() {
    return Timestamp(std::chrono::duration_cast<Duration>(
        Clock::now().time_since_epoch()).count());
}

std::string Timestamp::to_iso_string() const {
    const auto seconds = static_cast<std::time_t>(millis_ / 1000);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << (millis_ % 1000) << 'Z';
    return oss.str();
}

} // namespace tandem

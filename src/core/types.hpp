#pragma once

#include <array>
#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tandem {

/**
 * Canonical byte buffer used for every binary payload and frame.
 */
using Bytes = std::vector<uint8_t>;

/**
 * Uuid - 128-bit random identifier (version 4).
 *
 * Used for control message ids and locally created items.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Storage = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Storage bytes) noexcept : bytes_(bytes) {}

    [[nodiscard]] static Uuid generate();

    /**
     * Parse a UUID from a string (hyphens optional).
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str);

    /**
     * Hyphenated, lowercase form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Storage& bytes() const noexcept { return bytes_; }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Storage bytes_;
};

/**
 * Timestamp - milliseconds since the Unix epoch.
 *
 * Control messages carry it as a plain number; item and project records
 * carry the ISO 8601 form.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now();

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }

    /**
     * Format as ISO 8601 with milliseconds, UTC (e.g. 2024-05-01T10:00:00.000Z).
     */
    [[nodiscard]] std::string to_iso_string() const;

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

private:
    int64_t millis_;
};

} // namespace tandem

#pragma once

#include <array>
#include <chrono>
#include <compare>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace tidesync {

/**
 * Uuid - stable client-generated entity identity.
 *
 * 16 raw bytes; rendered as lowercase hyphenated text in the database,
 * on the wire and in logs.
 */
class Uuid {
public:
    using Bytes = std::array<uint8_t, 16>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    // Random (version 4, RFC 4122 variant).
    [[nodiscard]] static Uuid generate() {
        static thread_local std::mt19937_64 engine{std::random_device{}()};

        Bytes bytes;
        const uint64_t high = engine();
        const uint64_t low = engine();
        for (size_t i = 0; i < 8; ++i) {
            bytes[i] = static_cast<uint8_t>(high >> (56 - 8 * i));
            bytes[8 + i] = static_cast<uint8_t>(low >> (56 - 8 * i));
        }
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
        return Uuid(bytes);
    }

    // Hyphens are ignored wherever they appear; anything but 32 hex digits fails.
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view text) {
        Bytes bytes{};
        size_t digits = 0;
        for (char c : text) {
            if (c == '-') continue;
            const int nibble = hex_digit(c);
            if (nibble < 0 || digits == 32) return std::nullopt;
            bytes[digits / 2] = static_cast<uint8_t>(bytes[digits / 2] | (digits % 2 ? nibble : nibble << 4));
            ++digits;
        }
        if (digits != 32) return std::nullopt;
        return Uuid(bytes);
    }

    [[nodiscard]] std::string to_string() const {
        static constexpr char kHex[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < bytes_.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
            out += kHex[bytes_[i] >> 4];
            out += kHex[bytes_[i] & 0x0F];
        }
        return out;
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept { return bytes_ == Bytes{}; }
    [[nodiscard]] constexpr const Bytes& bytes() const noexcept { return bytes_; }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    static constexpr int hex_digit(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    Bytes bytes_;
};

/**
 * Timestamp - milliseconds since the Unix epoch.
 *
 * Used for lastModified, field stamps, server modification times and the
 * download watermark. Stored as INTEGER in SQLite.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        using namespace std::chrono;
        return Timestamp(duration_cast<Duration>(system_clock::now().time_since_epoch()).count());
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }

    // 2024-07-04T14:00:00.000Z
    [[nodiscard]] std::string to_iso_string() const {
        int64_t seconds = millis_ / 1000;
        int64_t ms = millis_ % 1000;
        if (ms < 0) {
            ms += 1000;
            --seconds;
        }
        const auto whole = static_cast<std::time_t>(seconds);
        std::tm utc{};
        gmtime_r(&whole, &utc);

        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900,
                      utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(ms));
        return buffer;
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const { return Timestamp(millis_ + d.count()); }
    Timestamp operator-(Duration d) const { return Timestamp(millis_ - d.count()); }
    Duration operator-(const Timestamp& other) const { return Duration(millis_ - other.millis_); }

private:
    int64_t millis_;
};

} // namespace tidesync

namespace std {
template<>
struct hash<tidesync::Uuid> {
    size_t operator()(const tidesync::Uuid& uuid) const noexcept {
        uint64_t h = 14695981039346656037ull;
        for (uint8_t b : uuid.bytes()) {
            h = (h ^ b) * 1099511628211ull;
        }
        return static_cast<size_t>(h);
    }
};
} // namespace std

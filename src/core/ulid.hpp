#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <compare>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>

namespace sortid {

namespace crypto {
class EntropySource;
}

/**
 * Ulid - Universally Unique Lexicographically Sortable Identifier.
 *
 * A 128-bit value: a 48-bit big-endian millisecond timestamp followed by 80
 * bits of entropy. Values are immutable; every accessor returns a copy.
 *
 * Because the time part is stored big-endian in front of the random part,
 * plain byte order, (time, random) order and text order all agree.
 */
class Ulid {
public:
    /**
     * Create the empty identifier (epoch, all-zero random part).
     */
    constexpr Ulid() noexcept : bytes_{} {}

    /**
     * Wrap a 16-byte layout. Every 16-byte value is a valid identifier.
     */
    explicit constexpr Ulid(const Bytes& bytes) noexcept : bytes_(bytes) {}

    [[nodiscard]] static constexpr Ulid empty() noexcept {
        return Ulid{};
    }

    /**
     * The largest identifier: time 2^48-1 ms, random part all 0xFF.
     */
    [[nodiscard]] static constexpr Ulid max_value() noexcept {
        Bytes b{};
        for (auto& x : b) x = 0xFF;
        return Ulid(b);
    }

    /**
     * Generate an identifier for the current UTC time using the default
     * entropy source.
     */
    [[nodiscard]] static Result<Ulid> generate();
    [[nodiscard]] static Result<Ulid> generate(Timestamp time);
    [[nodiscard]] static Result<Ulid> generate(crypto::EntropySource& source);

    /**
     * Generate an identifier for `time`, drawing exactly RANDOM_SIZE bytes
     * from `source` once. Fails with InvalidTimestamp if `time` lies outside
     * the 48-bit range; errors from the source are returned unchanged.
     */
    [[nodiscard]] static Result<Ulid> generate(Timestamp time, crypto::EntropySource& source);

    /**
     * Build from a time and an explicit random part. Fails with
     * InvalidTimestamp or InvalidRandomLength.
     */
    [[nodiscard]] static Result<Ulid> from_parts(Timestamp time, std::span<const uint8_t> random);

    /**
     * Wrap a raw 16-byte sequence. Fails with InvalidLength.
     */
    [[nodiscard]] static Result<Ulid> from_bytes(std::span<const uint8_t> bytes);

    /**
     * Same layout as from_bytes; no byte reordering is applied.
     */
    [[nodiscard]] static Result<Ulid> from_guid_bytes(std::span<const uint8_t> bytes);

    /**
     * Parse the 26-symbol text form, case-insensitively.
     *
     * Fails with InvalidInput for empty text, InvalidLength unless exactly
     * 26 symbols, InvalidCharacter for symbols outside the alphabet.
     */
    [[nodiscard]] static Result<Ulid> parse(std::string_view text);

    /**
     * Parse without reporting why. On failure `result` is set to empty().
     */
    [[nodiscard]] static bool try_parse(std::string_view text, Ulid& result);

    [[nodiscard]] Timestamp time() const noexcept;
    [[nodiscard]] RandomBytes random() const noexcept;

    [[nodiscard]] Bytes to_bytes() const noexcept {
        return bytes_;
    }

    [[nodiscard]] Bytes to_guid_bytes() const noexcept {
        return bytes_;
    }

    /**
     * 26 uppercase symbols: 10 for the time part, 16 for the random part.
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr bool is_empty() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    /**
     * Three-way comparison as -1, 0 or 1.
     */
    [[nodiscard]] int compare(const Ulid& other) const noexcept;

    /**
     * FNV-1a over the time in milliseconds and the random bytes.
     */
    [[nodiscard]] size_t hash() const noexcept;

    auto operator<=>(const Ulid&) const = default;
    bool operator==(const Ulid&) const = default;

private:
    Bytes bytes_;
};

std::ostream& operator<<(std::ostream& os, const Ulid& id);

} // namespace sortid

namespace std {
    template<>
    struct hash<sortid::Ulid> {
        size_t operator()(const sortid::Ulid& id) const noexcept {
            return id.hash();
        }
    };
}

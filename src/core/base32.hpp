#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sortid::base32 {

/**
 * The 32-symbol alphabet. I, L, O and U are left out to avoid visual
 * ambiguity; symbol order equals value order, so encoded blocks of equal
 * length sort the same way as the bytes they encode.
 */
constexpr std::string_view ALPHABET = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

/**
 * Map a symbol to its 5-bit value. Lowercase ASCII letters are folded to
 * uppercase first. Returns -1 for anything outside the alphabet.
 */
[[nodiscard]] int symbol_value(char c) noexcept;

// Fixed-size transforms used by the identifier.

void encode_time(const TimeBytes& in, std::span<char, TIME_TEXT_SIZE> out) noexcept;
void encode_random(const RandomBytes& in, std::span<char, RANDOM_TEXT_SIZE> out) noexcept;

/**
 * Decode a 10-symbol time block. Fails with InvalidLength or
 * InvalidCharacter; a leading symbol above '7' would overflow 48 bits and is
 * reported as InvalidCharacter.
 */
[[nodiscard]] Result<TimeBytes> decode_time(std::string_view text);

/**
 * Decode a 16-symbol random block. Fails with InvalidLength or
 * InvalidCharacter.
 */
[[nodiscard]] Result<RandomBytes> decode_random(std::string_view text);

// Generic entry points: only 6 and 10 byte blocks (10 and 16 symbols) exist.

[[nodiscard]] Result<std::string> encode(std::span<const uint8_t> block);
[[nodiscard]] Result<std::vector<uint8_t>> decode(std::string_view text);

} // namespace sortid::base32

#include "core/base32.hpp"

#include <algorithm>
#include <array>

namespace sortid::base32 {

namespace {

constexpr std::array<int8_t, 256> build_decode_table() {
    std::array<int8_t, 256> table{};
    for (auto& v : table) v = -1;
    for (size_t i = 0; i < ALPHABET.size(); ++i) {
        const auto c = static_cast<unsigned char>(ALPHABET[i]);
        table[c] = static_cast<int8_t>(i);
        if (c >= 'A' && c <= 'Z') {
            table[c - 'A' + 'a'] = static_cast<int8_t>(i);
        }
    }
    return table;
}

constexpr auto DECODE = build_decode_table();

inline char sym(unsigned v) noexcept {
    return ALPHABET[v & 0x1F];
}

Error length_error(size_t expected, size_t actual) {
    return Error{ErrorCode::InvalidLength,
                 "expected " + std::to_string(expected) + " symbols, got " +
                     std::to_string(actual)};
}

// Resolve every symbol to its 5-bit value or report the first bad one.
template<size_t N>
Result<std::array<uint8_t, N>> lookup(std::string_view text) {
    if (text.size() != N) {
        return Result<std::array<uint8_t, N>>::err(length_error(N, text.size()));
    }
    std::array<uint8_t, N> ix{};
    for (size_t i = 0; i < N; ++i) {
        const int v = symbol_value(text[i]);
        if (v < 0) {
            return Result<std::array<uint8_t, N>>::err(Error{
                ErrorCode::InvalidCharacter,
                std::string("invalid base32 symbol '") + text[i] + "' at position " +
                    std::to_string(i)});
        }
        ix[i] = static_cast<uint8_t>(v);
    }
    return Result<std::array<uint8_t, N>>::ok(ix);
}

} // namespace

int symbol_value(char c) noexcept {
    return DECODE[static_cast<unsigned char>(c)];
}

void encode_time(const TimeBytes& v, std::span<char, TIME_TEXT_SIZE> out) noexcept {
    // 48 bits into 50: the first symbol carries only the top 3 bits.
    out[0] = sym((v[0] & 0xE0) >> 5);
    out[1] = sym(v[0] & 0x1F);
    out[2] = sym((v[1] & 0xF8) >> 3);
    out[3] = sym(((v[1] & 0x07) << 2) | ((v[2] & 0xC0) >> 6));
    out[4] = sym((v[2] & 0x3E) >> 1);
    out[5] = sym(((v[2] & 0x01) << 4) | ((v[3] & 0xF0) >> 4));
    out[6] = sym(((v[3] & 0x0F) << 1) | ((v[4] & 0x80) >> 7));
    out[7] = sym((v[4] & 0x7C) >> 2);
    out[8] = sym(((v[4] & 0x03) << 3) | ((v[5] & 0xE0) >> 5));
    out[9] = sym(v[5] & 0x1F);
}

void encode_random(const RandomBytes& v, std::span<char, RANDOM_TEXT_SIZE> out) noexcept {
    // Two identical 40-bit groups of 5 bytes -> 8 symbols.
    out[0] = sym((v[0] & 0xF8) >> 3);
    out[1] = sym(((v[0] & 0x07) << 2) | ((v[1] & 0xC0) >> 6));
    out[2] = sym((v[1] & 0x3E) >> 1);
    out[3] = sym(((v[1] & 0x01) << 4) | ((v[2] & 0xF0) >> 4));
    out[4] = sym(((v[2] & 0x0F) << 1) | ((v[3] & 0x80) >> 7));
    out[5] = sym((v[3] & 0x7C) >> 2);
    out[6] = sym(((v[3] & 0x03) << 3) | ((v[4] & 0xE0) >> 5));
    out[7] = sym(v[4] & 0x1F);
    out[8] = sym((v[5] & 0xF8) >> 3);
    out[9] = sym(((v[5] & 0x07) << 2) | ((v[6] & 0xC0) >> 6));
    out[10] = sym((v[6] & 0x3E) >> 1);
    out[11] = sym(((v[6] & 0x01) << 4) | ((v[7] & 0xF0) >> 4));
    out[12] = sym(((v[7] & 0x0F) << 1) | ((v[8] & 0x80) >> 7));
    out[13] = sym((v[8] & 0x7C) >> 2);
    out[14] = sym(((v[8] & 0x03) << 3) | ((v[9] & 0xE0) >> 5));
    out[15] = sym(v[9] & 0x1F);
}

Result<TimeBytes> decode_time(std::string_view text) {
    auto looked_up = lookup<TIME_TEXT_SIZE>(text);
    if (looked_up.is_err()) {
        return Result<TimeBytes>::err(looked_up.unwrap_err());
    }
    const auto& ix = looked_up.unwrap();
    if (ix[0] > 7) {
        return Result<TimeBytes>::err(Error{
            ErrorCode::InvalidCharacter,
            std::string("time symbol '") + text[0] + "' exceeds the 48-bit range"});
    }

    return Result<TimeBytes>::ok(TimeBytes{
        static_cast<uint8_t>((ix[0] << 5) | ix[1]),
        static_cast<uint8_t>((ix[2] << 3) | (ix[3] >> 2)),
        static_cast<uint8_t>((ix[3] << 6) | (ix[4] << 1) | (ix[5] >> 4)),
        static_cast<uint8_t>((ix[5] << 4) | (ix[6] >> 1)),
        static_cast<uint8_t>((ix[6] << 7) | (ix[7] << 2) | (ix[8] >> 3)),
        static_cast<uint8_t>((ix[8] << 5) | ix[9]),
    });
}

Result<RandomBytes> decode_random(std::string_view text) {
    auto looked_up = lookup<RANDOM_TEXT_SIZE>(text);
    if (looked_up.is_err()) {
        return Result<RandomBytes>::err(looked_up.unwrap_err());
    }
    const auto& ix = looked_up.unwrap();

    return Result<RandomBytes>::ok(RandomBytes{
        static_cast<uint8_t>((ix[0] << 3) | (ix[1] >> 2)),
        static_cast<uint8_t>((ix[1] << 6) | (ix[2] << 1) | (ix[3] >> 4)),
        static_cast<uint8_t>((ix[3] << 4) | (ix[4] >> 1)),
        static_cast<uint8_t>((ix[4] << 7) | (ix[5] << 2) | (ix[6] >> 3)),
        static_cast<uint8_t>((ix[6] << 5) | ix[7]),
        static_cast<uint8_t>((ix[8] << 3) | (ix[9] >> 2)),
        static_cast<uint8_t>((ix[9] << 6) | (ix[10] << 1) | (ix[11] >> 4)),
        static_cast<uint8_t>((ix[11] << 4) | (ix[12] >> 1)),
        static_cast<uint8_t>((ix[12] << 7) | (ix[13] << 2) | (ix[14] >> 3)),
        static_cast<uint8_t>((ix[14] << 5) | ix[15]),
    });
}

Result<std::string> encode(std::span<const uint8_t> block) {
    if (block.size() == TIME_SIZE) {
        TimeBytes in{};
        std::copy(block.begin(), block.end(), in.begin());
        std::string out(TIME_TEXT_SIZE, '0');
        encode_time(in, std::span<char, TIME_TEXT_SIZE>(out.data(), TIME_TEXT_SIZE));
        return Result<std::string>::ok(std::move(out));
    }
    if (block.size() == RANDOM_SIZE) {
        RandomBytes in{};
        std::copy(block.begin(), block.end(), in.begin());
        std::string out(RANDOM_TEXT_SIZE, '0');
        encode_random(in, std::span<char, RANDOM_TEXT_SIZE>(out.data(), RANDOM_TEXT_SIZE));
        return Result<std::string>::ok(std::move(out));
    }
    return Result<std::string>::err(Error{
        ErrorCode::InvalidLength,
        "only 6 or 10 byte blocks can be encoded, got " + std::to_string(block.size())});
}

Result<std::vector<uint8_t>> decode(std::string_view text) {
    using Out = Result<std::vector<uint8_t>>;
    if (text.size() == TIME_TEXT_SIZE) {
        return decode_time(text).match(
            [](const TimeBytes& b) { return Out::ok(std::vector<uint8_t>(b.begin(), b.end())); },
            [](const Error& e) { return Out::err(e); });
    }
    if (text.size() == RANDOM_TEXT_SIZE) {
        return decode_random(text).match(
            [](const RandomBytes& b) { return Out::ok(std::vector<uint8_t>(b.begin(), b.end())); },
            [](const Error& e) { return Out::err(e); });
    }
    return Out::err(Error{
        ErrorCode::InvalidLength,
        "only 10 or 16 symbol blocks can be decoded, got " + std::to_string(text.size())});
}

} // namespace sortid::base32

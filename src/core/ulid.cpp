#include "core/ulid.hpp"
#include "core/base32.hpp"
#include "core/binary_codec.hpp"
#include "crypto/entropy.hpp"

#include <algorithm>
#include <optional>
#include <ostream>

namespace sortid {

namespace {

std::optional<Error> time_error(Timestamp time) {
    if (time.millis() < 0) {
        return Error{ErrorCode::InvalidTimestamp,
                     "timestamp " + std::to_string(time.millis()) + " ms precedes the epoch"};
    }
    if (!time.is_representable()) {
        return Error{ErrorCode::InvalidTimestamp,
                     "timestamp " + std::to_string(time.millis()) + " ms exceeds the 48-bit range"};
    }
    return std::nullopt;
}

} // namespace

Result<Ulid> Ulid::generate() {
    return generate(Timestamp::now(), crypto::default_entropy_source());
}

Result<Ulid> Ulid::generate(Timestamp time) {
    return generate(time, crypto::default_entropy_source());
}

Result<Ulid> Ulid::generate(crypto::EntropySource& source) {
    return generate(Timestamp::now(), source);
}

Result<Ulid> Ulid::generate(Timestamp time, crypto::EntropySource& source) {
    // A bad timestamp never consumes entropy.
    if (auto e = time_error(time)) {
        return Result<Ulid>::err(*e);
    }
    auto random = source.get_random_bytes(RANDOM_SIZE);
    if (random.is_err()) {
        return Result<Ulid>::err(random.unwrap_err());
    }
    return from_parts(time, random.unwrap());
}

Result<Ulid> Ulid::from_parts(Timestamp time, std::span<const uint8_t> random) {
    if (auto e = time_error(time)) {
        return Result<Ulid>::err(*e);
    }
    if (random.size() != RANDOM_SIZE) {
        return Result<Ulid>::err(Error{
            ErrorCode::InvalidRandomLength,
            "random part must be " + std::to_string(RANDOM_SIZE) + " bytes, got " +
                std::to_string(random.size())});
    }
    RandomBytes r{};
    std::copy(random.begin(), random.end(), r.begin());
    return Result<Ulid>::ok(Ulid(binary::assemble(binary::encode_time(time), r)));
}

Result<Ulid> Ulid::from_bytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != BYTE_SIZE) {
        return Result<Ulid>::err(Error{
            ErrorCode::InvalidLength,
            "an identifier needs exactly " + std::to_string(BYTE_SIZE) + " bytes, got " +
                std::to_string(bytes.size())});
    }
    Bytes b{};
    std::copy(bytes.begin(), bytes.end(), b.begin());
    return Result<Ulid>::ok(Ulid(b));
}

Result<Ulid> Ulid::from_guid_bytes(std::span<const uint8_t> bytes) {
    return from_bytes(bytes);
}

Result<Ulid> Ulid::parse(std::string_view text) {
    if (text.empty()) {
        return Result<Ulid>::err(Error{ErrorCode::InvalidInput, "identifier text is empty"});
    }
    if (text.size() != TEXT_SIZE) {
        return Result<Ulid>::err(Error{
            ErrorCode::InvalidLength,
            "identifier text must be " + std::to_string(TEXT_SIZE) + " symbols, got " +
                std::to_string(text.size())});
    }

    // Report the first bad symbol across the whole string before decoding
    // either block.
    for (size_t i = 0; i < text.size(); ++i) {
        if (base32::symbol_value(text[i]) < 0) {
            return Result<Ulid>::err(Error{
                ErrorCode::InvalidCharacter,
                std::string("invalid base32 symbol '") + text[i] + "' at position " +
                    std::to_string(i)});
        }
    }

    auto time = base32::decode_time(text.substr(0, TIME_TEXT_SIZE));
    if (time.is_err()) {
        return Result<Ulid>::err(time.unwrap_err());
    }
    auto random = base32::decode_random(text.substr(TIME_TEXT_SIZE, RANDOM_TEXT_SIZE));
    if (random.is_err()) {
        return Result<Ulid>::err(random.unwrap_err());
    }
    return Result<Ulid>::ok(Ulid(binary::assemble(time.unwrap(), random.unwrap())));
}

bool Ulid::try_parse(std::string_view text, Ulid& result) {
    auto parsed = parse(text);
    result = parsed.value_or(Ulid::empty());
    return parsed.is_ok();
}

Timestamp Ulid::time() const noexcept {
    return binary::decode_time(binary::split_time(bytes_));
}

RandomBytes Ulid::random() const noexcept {
    return binary::split_random(bytes_);
}

std::string Ulid::to_string() const {
    std::string out(TEXT_SIZE, '0');
    base32::encode_time(binary::split_time(bytes_),
                        std::span<char, TIME_TEXT_SIZE>(out.data(), TIME_TEXT_SIZE));
    base32::encode_random(binary::split_random(bytes_),
                          std::span<char, RANDOM_TEXT_SIZE>(out.data() + TIME_TEXT_SIZE,
                                                            RANDOM_TEXT_SIZE));
    return out;
}

int Ulid::compare(const Ulid& other) const noexcept {
    const auto by_time = time() <=> other.time();
    if (by_time != 0) {
        return by_time < 0 ? -1 : 1;
    }
    const auto a = random();
    const auto b = other.random();
    for (size_t i = 0; i < RANDOM_SIZE; ++i) {
        if (a[i] != b[i]) {
            return a[i] < b[i] ? -1 : 1;
        }
    }
    return 0;
}

size_t Ulid::hash() const noexcept {
    constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
    constexpr uint64_t FNV_PRIME = 1099511628211ULL;

    uint64_t h = FNV_OFFSET;
    const auto ms = static_cast<uint64_t>(time().millis());
    for (int shift = 0; shift < 64; shift += 8) {
        h = (h ^ ((ms >> shift) & 0xFF)) * FNV_PRIME;
    }
    for (auto b : random()) {
        h = (h ^ b) * FNV_PRIME;
    }
    return static_cast<size_t>(h);
}

std::ostream& operator<<(std::ostream& os, const Ulid& id) {
    return os << id.to_string();
}

} // namespace sortid

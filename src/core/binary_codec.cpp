#include "core/binary_codec.hpp"

#include <algorithm>

namespace sortid::binary {

TimeBytes encode_time(Timestamp time) noexcept {
    const auto ms = static_cast<uint64_t>(time.millis());
    return TimeBytes{
        static_cast<uint8_t>(ms >> 40),
        static_cast<uint8_t>(ms >> 32),
        static_cast<uint8_t>(ms >> 24),
        static_cast<uint8_t>(ms >> 16),
        static_cast<uint8_t>(ms >> 8),
        static_cast<uint8_t>(ms),
    };
}

Timestamp decode_time(const TimeBytes& bytes) noexcept {
    uint64_t ms = 0;
    for (auto b : bytes) {
        ms = (ms << 8) | b;
    }
    return Timestamp(static_cast<int64_t>(ms));
}

Bytes assemble(const TimeBytes& time, const RandomBytes& random) noexcept {
    Bytes out{};
    std::copy(time.begin(), time.end(), out.begin());
    std::copy(random.begin(), random.end(), out.begin() + TIME_SIZE);
    return out;
}

TimeBytes split_time(const Bytes& bytes) noexcept {
    TimeBytes out{};
    std::copy_n(bytes.begin(), TIME_SIZE, out.begin());
    return out;
}

RandomBytes split_random(const Bytes& bytes) noexcept {
    RandomBytes out{};
    std::copy_n(bytes.begin() + TIME_SIZE, RANDOM_SIZE, out.begin());
    return out;
}

} // namespace sortid::binary

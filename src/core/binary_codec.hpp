#pragma once

#include "core/types.hpp"

namespace sortid::binary {

/**
 * Write the low 48 bits of the millisecond count, most significant byte
 * first. Callers are expected to have checked Timestamp::is_representable().
 */
[[nodiscard]] TimeBytes encode_time(Timestamp time) noexcept;

/**
 * Zero-extend a 48-bit big-endian millisecond count back to a Timestamp.
 */
[[nodiscard]] Timestamp decode_time(const TimeBytes& bytes) noexcept;

// 16-byte layout: time part first, random part after.

[[nodiscard]] Bytes assemble(const TimeBytes& time, const RandomBytes& random) noexcept;
[[nodiscard]] TimeBytes split_time(const Bytes& bytes) noexcept;
[[nodiscard]] RandomBytes split_random(const Bytes& bytes) noexcept;

} // namespace sortid::binary

#include "core/types.hpp"

#include <type_traits>

// Implementation is entirely in the header for this simple types module.
// This file exists for build system compatibility.

namespace sortid {

static_assert(BYTE_SIZE == 16, "identifier layout must be 16 bytes");
static_assert(TEXT_SIZE == 26, "identifier text must be 26 symbols");
static_assert(TIME_TEXT_SIZE * 5 >= TIME_SIZE * 8, "time text must cover 48 bits");
static_assert(RANDOM_TEXT_SIZE * 5 == RANDOM_SIZE * 8, "random text must cover 80 bits");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

} // namespace sortid

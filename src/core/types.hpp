#pragma once

#include <array>
#include <chrono>
#include <compare>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace sortid {

// Fixed layout of an identifier.
constexpr size_t TIME_SIZE = 6;
constexpr size_t RANDOM_SIZE = 10;
constexpr size_t BYTE_SIZE = TIME_SIZE + RANDOM_SIZE;

constexpr size_t TIME_TEXT_SIZE = 10;
constexpr size_t RANDOM_TEXT_SIZE = 16;
constexpr size_t TEXT_SIZE = TIME_TEXT_SIZE + RANDOM_TEXT_SIZE;

using TimeBytes = std::array<uint8_t, TIME_SIZE>;
using RandomBytes = std::array<uint8_t, RANDOM_SIZE>;
using Bytes = std::array<uint8_t, BYTE_SIZE>;

/**
 * Timestamp - A UTC point in time with millisecond resolution.
 *
 * Stored as signed milliseconds since the Unix epoch so that instants before
 * 1970 can be represented (and rejected) by the identifier factories.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    /**
     * The largest instant a 48-bit time part can hold (year 10889).
     */
    static constexpr int64_t MAX_MILLIS = (int64_t{1} << 48) - 1;

    /**
     * Create a timestamp at the Unix epoch.
     */
    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    /**
     * Create a timestamp from a time point, truncated to milliseconds.
     */
    template<typename Dur>
    explicit Timestamp(std::chrono::time_point<Clock, Dur> tp) noexcept
        : millis_(std::chrono::floor<Duration>(tp.time_since_epoch()).count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(Clock::now());
    }

    [[nodiscard]] static constexpr Timestamp epoch() noexcept {
        return Timestamp{};
    }

    [[nodiscard]] static constexpr Timestamp max() noexcept {
        return Timestamp(MAX_MILLIS);
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    /**
     * True if the instant fits the 48-bit unsigned millisecond range.
     */
    [[nodiscard]] constexpr bool is_representable() const noexcept {
        return millis_ >= 0 && millis_ <= MAX_MILLIS;
    }

    [[nodiscard]] TimePoint to_time_point() const noexcept {
        return TimePoint(Duration(millis_));
    }

    /**
     * Format as ISO 8601 in UTC, e.g. 2016-07-30T23:54:10.259Z.
     */
    [[nodiscard]] std::string to_iso_string() const {
        auto seconds = millis_ / 1000;
        auto ms = millis_ % 1000;
        if (ms < 0) {
            ms += 1000;
            --seconds;
        }
        auto time_t = static_cast<std::time_t>(seconds);
        std::tm tm{};
        gmtime_r(&time_t, &tm);

        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const {
        return Timestamp(millis_ + d.count());
    }

    Timestamp operator-(Duration d) const {
        return Timestamp(millis_ - d.count());
    }

    Duration operator-(const Timestamp& other) const {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_;
};

} // namespace sortid

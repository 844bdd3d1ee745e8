#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace Cerebrum {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Format as ISO-8601 UTC with millisecond precision ("2024-02-01T00:00:00.000Z").
 */
std::string to_iso_string(TimePoint tp);

/**
 * @brief Parse an ISO-8601 timestamp.
 *
 * Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS", optional fractional seconds and
 * an optional "Z" or "+HH:MM" / "-HH:MM" offset. Returns nullopt when malformed.
 */
std::optional<TimePoint> parse_iso_time(const std::string& text);

/**
 * @brief High-resolution timer and high-level timing utilities.
 */
class Timer {
public:
    using SteadyClock = std::chrono::steady_clock;

    Timer() : start_(SteadyClock::now()) {}

    void reset() {
        start_ = SteadyClock::now();
    }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(SteadyClock::now() - start_).count();
    }

private:
    SteadyClock::time_point start_;
};

} // namespace Cerebrum

#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace Lookalike {

/**
 * @brief High-resolution timer and high-level timing utilities.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    /**
     * @brief Reset the timer to the current time.
     */
    void reset() {
        start_ = Clock::now();
    }

    /**
     * @brief Get elapsed milliseconds since last reset or construction.
     */
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    /**
     * @brief Get elapsed seconds since last reset or construction.
     */
    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

    static double ms_since(TimePoint start) {
        return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    }

private:
    TimePoint start_;
};

/**
 * @brief Wall-clock seconds since the Unix epoch (relation creation stamps).
 */
inline int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/**
 * @brief Format epoch seconds as UTC ISO-8601 ("2026-01-31T12:00:00Z").
 */
inline std::string format_utc(int64_t epoch_seconds) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // namespace Lookalike

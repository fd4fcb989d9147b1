#pragma once

#include <chrono>
#include <ctime>
#include <optional>
#include <string>

namespace WikiCorpus {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief High-resolution timer used for progress reporting.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;

    Timer() : start_(Clock::now()) {}

    void reset() {
        start_ = Clock::now();
    }

    /**
     * @brief Get elapsed milliseconds since last reset or construction.
     */
    double elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

private:
    Clock::time_point start_;
};

/**
 * @brief Parse an ISO-8601 UTC timestamp of the form YYYY-MM-DDTHH:MM:SSZ.
 *
 * The trailing 'Z' is optional. Returns nullopt on any deviation.
 */
std::optional<TimePoint> parse_iso8601(const std::string& text);

/**
 * @brief Format as YYYY-MM-DDTHH:MM:SSZ (UTC, second precision).
 */
std::string format_iso8601(TimePoint tp);

} // namespace WikiCorpus

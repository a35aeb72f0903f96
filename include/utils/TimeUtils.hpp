#pragma once

#include <chrono>
#include <ctime>
#include <cstdint>
#include <string>
#include <string_view>

namespace Triage
{
    namespace Utils
    {
        /**
         * Time helpers for log lines, build timestamps and request ids.
         *
         * Notes:
         *  - system_clock throughout; build timestamps are wall-clock values.
         *  - All functions are thread-safe (no shared mutable state).
         */

        using Clock        = std::chrono::system_clock;
        using TimePoint    = std::chrono::time_point<Clock>;
        using milliseconds = std::chrono::milliseconds;

        TimePoint now() noexcept;

        /**
         * Format a TimePoint in local time.
         * Default format: "YYYY-MM-DD HH:MM:SS" (used by the Logger).
         */
        std::string formatTimestamp(TimePoint tp,
                                     std::string_view format = "%Y-%m-%d %H:%M:%S");

        /// UTC ISO-8601 string with a trailing 'Z': "2025-10-03T14:23:45Z".
        std::string toIso8601Utc(TimePoint tp);

        /// Nanoseconds since the UNIX epoch; used to mint request ids.
        std::int64_t toNanosSinceEpoch(TimePoint tp) noexcept;

        /// Duration between two time points in milliseconds.
        std::int64_t diffMillis(TimePoint start, TimePoint end) noexcept;

    } // namespace Utils
} // namespace Triage

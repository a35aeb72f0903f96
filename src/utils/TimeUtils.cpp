#include "utils/TimeUtils.hpp"

#include <iomanip>
#include <sstream>

namespace Triage
{
    namespace Utils
    {
        TimePoint now() noexcept
        {
            return Clock::now();
        }

        // -------- Formatting helpers --------

        std::string formatTimestamp(TimePoint tp, std::string_view format)
        {
            const std::string fmt(format);
            std::time_t t = Clock::to_time_t(tp);
            std::tm tm_buf{};
        #if defined(_WIN32)
            localtime_s(&tm_buf, &t);
        #else
            localtime_r(&t, &tm_buf);
        #endif

            std::ostringstream oss;
            oss << std::put_time(&tm_buf, fmt.c_str());
            return oss.str();
        }

        std::string toIso8601Utc(TimePoint tp)
        {
            std::time_t t = Clock::to_time_t(tp);
            std::tm tm_buf{};
        #if defined(_WIN32)
            gmtime_s(&tm_buf, &t);
        #else
            gmtime_r(&t, &tm_buf);
        #endif

            std::ostringstream oss;
            oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
            return oss.str();
        }

        // -------- Epoch conversions and differences --------

        std::int64_t toNanosSinceEpoch(TimePoint tp) noexcept
        {
            const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch());
            return static_cast<std::int64_t>(ns.count());
        }

        std::int64_t diffMillis(TimePoint start, TimePoint end) noexcept
        {
            return std::chrono::duration_cast<milliseconds>(end - start).count();
        }

    } // namespace Utils
} // namespace Triage

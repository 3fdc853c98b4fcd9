#include "linkdrop/timestamp.hpp"

#include <array>
#include <ctime>
#include <stdexcept>

namespace linkdrop
{

    std::int64_t to_unix_seconds(TimePoint time) noexcept
    {
        return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
    }

    TimePoint from_unix_seconds(std::int64_t seconds) noexcept
    {
        return TimePoint{std::chrono::seconds{seconds}};
    }

    std::string format_iso8601_utc(TimePoint time)
    {
        const auto seconds = static_cast<std::time_t>(to_unix_seconds(time));
        std::tm tm{};
        if (gmtime_r(&seconds, &tm) == nullptr)
        {
            throw std::runtime_error("Timestamp out of range");
        }
        std::array<char, 32> buffer{};
        const auto written = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%SZ", &tm);
        return std::string(buffer.data(), written);
    }

} // namespace linkdrop

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace linkdrop
{

    using TimePoint = std::chrono::system_clock::time_point;

    std::int64_t to_unix_seconds(TimePoint time) noexcept;

    TimePoint from_unix_seconds(std::int64_t seconds) noexcept;

    // "YYYY-MM-DDTHH:MM:SSZ"
    std::string format_iso8601_utc(TimePoint time);

} // namespace linkdrop

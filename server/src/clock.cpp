#include "linkdrop/server/clock.hpp"

namespace linkdrop::server
{

    TimePoint SystemClock::now() const
    {
        return std::chrono::system_clock::now();
    }

} // namespace linkdrop::server

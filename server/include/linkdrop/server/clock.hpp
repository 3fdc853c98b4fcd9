#pragma once

#include "linkdrop/timestamp.hpp"

namespace linkdrop::server
{

    class Clock
    {
    public:
        virtual ~Clock() = default;

        virtual TimePoint now() const = 0;
    };

    class SystemClock final : public Clock
    {
    public:
        TimePoint now() const override;
    };

} // namespace linkdrop::server

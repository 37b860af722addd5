#pragma once

#include <VirtualTime/TimeSource.hpp>

namespace evtelemetry::time
{
    // Wall-clock time source for live runs.
    class SteadyClock : public TimeSource
    {
    public:
        [[nodiscard]] TimePoint now() const noexcept override;
    };
} // namespace evtelemetry::time

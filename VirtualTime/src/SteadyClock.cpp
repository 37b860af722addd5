#include <VirtualTime/SteadyClock.hpp>

namespace evtelemetry::time
{
    SteadyClock::TimePoint SteadyClock::now() const noexcept
    {
        return std::chrono::steady_clock::now();
    }
} // namespace evtelemetry::time

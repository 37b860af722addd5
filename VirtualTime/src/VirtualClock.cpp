#include <VirtualTime/VirtualClock.hpp>

namespace evtelemetry::time
{
    VirtualClock::VirtualClock() noexcept : m_current(TimePoint{}) {} // start at zero epoch

    VirtualClock::TimePoint VirtualClock::now() const noexcept
    {
        return m_current;
    }

    void VirtualClock::advance(Duration delta) noexcept
    {
        if (delta < Duration::zero())
        {
            return;
        }

        m_current += delta;
    }

    void VirtualClock::advanceSeconds(double seconds) noexcept
    {
        advance(std::chrono::duration_cast<Duration>(std::chrono::duration<double>(seconds)));
    }

    void VirtualClock::reset() noexcept
    {
        m_current = TimePoint{};
    }

} // namespace evtelemetry::time

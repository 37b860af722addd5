#pragma once

#include <VirtualTime/TimeSource.hpp>

namespace evtelemetry::time
{
    /// Manually driven clock for tests and replay. Time only moves when advance() is called.
    class VirtualClock : public TimeSource
    {
    public:
        /// Constructs the clock at a well-defined epoch which is zero.
        VirtualClock() noexcept;

        // Returns current virtual time
        [[nodiscard]] TimePoint now() const noexcept override;

        /// Advances the virtual time by the given duration.
        /// Negative deltas are ignored
        void advance(Duration delta) noexcept;

        /// Convenience overload for fractional seconds.
        void advanceSeconds(double seconds) noexcept;

        /// Resets the clock back to the initial epoch.
        void reset() noexcept;

    private:
        TimePoint m_current;
    };
} // namespace evtelemetry::time

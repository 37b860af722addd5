#pragma once

#include <chrono>

namespace evtelemetry::time
{
    /// Source of "now" for every simulator and driving loop. Simulators never read
    /// std::chrono clocks directly so runs can be replayed deterministically.
    class TimeSource
    {
    public:
        using TimePoint = std::chrono::steady_clock::time_point;
        using Duration = std::chrono::steady_clock::duration;

        virtual ~TimeSource() = default;

        [[nodiscard]] virtual TimePoint now() const noexcept = 0;
    };

    // Seconds between two time points as a double; negative spans collapse to zero.
    [[nodiscard]] inline double elapsedSeconds(TimeSource::TimePoint from, TimeSource::TimePoint to) noexcept
    {
        const double dt = std::chrono::duration<double>(to - from).count();
        return dt > 0.0 ? dt : 0.0;
    }
} // namespace evtelemetry::time

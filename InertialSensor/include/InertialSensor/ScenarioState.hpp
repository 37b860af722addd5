#pragma once

#include <EvTelemetrySim/Messages.hpp>
#include <RandomSource/RandomSource.hpp>
#include <cstddef>
#include <variant>

namespace evtelemetry::inertial
{
    // Times are simulation seconds since the owning simulator was constructed.

    struct FallEvent
    {
        static constexpr double kDuration = 2.0;

        double startTime{0.0};
        bool sideImpact{true};         // side (x) or front (y) impact
        float restingTiltRad{1.3f};    // final lean once the vehicle lies still
    };

    struct PotholeEvent
    {
        static constexpr double kDuration = 0.5;

        double startTime{0.0};
    };

    using ScheduledEvent = std::variant<FallEvent, PotholeEvent>;

    // Riding normally while waiting for the next scheduled event.
    struct NormalRiding
    {
        ScheduledEvent next;
    };

    using ScenarioState = std::variant<NormalRiding, FallEvent, PotholeEvent>;

    struct ScenarioSchedule
    {
        double minIntervalSec = 20.0;
        double maxIntervalSec = 60.0;
        double fallProbability = 0.3;
    };

    /// Draws the next event: start = now + U[min, max), Fall with fallProbability, else Pothole.
    ScheduledEvent scheduleNextEvent(double now, const ScenarioSchedule &schedule, random::RandomSource &rng);

    [[nodiscard]] ScenarioKind kindOf(const ScenarioState &state) noexcept;
    [[nodiscard]] ScenarioKind kindOf(const ScheduledEvent &event) noexcept;
    [[nodiscard]] double startTimeOf(const ScheduledEvent &event) noexcept;

    // What a single tick should render: the state that was active and how far into it.
    struct ScenarioStep
    {
        ScenarioState state;
        double progress{0.0};
    };

    /// Normal -> {Fall, Pothole} -> Normal transition function.
    ///
    /// An event activates once simulation time reaches its start. Its progress is
    /// min(1, (now - start) / duration); the tick that reaches 1.0 still renders the
    /// event, then the machine returns to NormalRiding with a freshly scheduled event
    /// and progress reset to 0.
    class ScenarioMachine
    {
    public:
        ScenarioMachine(const ScenarioSchedule &schedule, random::RandomSource &rng, double now = 0.0);

        ScenarioStep advance(double now);

        [[nodiscard]] const ScenarioState &state() const noexcept { return m_state; }
        [[nodiscard]] ScenarioKind kind() const noexcept { return kindOf(m_state); }
        [[nodiscard]] double progress() const noexcept { return m_progress; }
        [[nodiscard]] std::size_t completedEvents() const noexcept { return m_completedEvents; }

    private:
        ScenarioSchedule m_schedule;
        random::RandomSource &m_rng;

        ScenarioState m_state;
        double m_progress{0.0};
        std::size_t m_completedEvents{0};
    };
} // namespace evtelemetry::inertial

#include <InertialSensor/ScenarioState.hpp>

#include <algorithm>

namespace evtelemetry::inertial
{
    namespace
    {
        constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

        ScenarioState activate(const ScheduledEvent &event)
        {
            if (const auto *fall = std::get_if<FallEvent>(&event))
                return *fall;
            return std::get<PotholeEvent>(event);
        }
    } // namespace

    ScheduledEvent scheduleNextEvent(double now, const ScenarioSchedule &schedule, random::RandomSource &rng)
    {
        const double start = now + rng.uniform(schedule.minIntervalSec, schedule.maxIntervalSec);

        if (rng.chance(schedule.fallProbability))
        {
            FallEvent fall;
            fall.startTime = start;
            fall.sideImpact = rng.chance(0.5);
            fall.restingTiltRad = static_cast<float>(rng.uniform(60.0, 90.0) * kDegToRad);
            return fall;
        }

        PotholeEvent pothole;
        pothole.startTime = start;
        return pothole;
    }

    ScenarioKind kindOf(const ScenarioState &state) noexcept
    {
        if (std::holds_alternative<FallEvent>(state))
            return ScenarioKind::Fall;
        if (std::holds_alternative<PotholeEvent>(state))
            return ScenarioKind::Pothole;
        return ScenarioKind::Normal;
    }

    ScenarioKind kindOf(const ScheduledEvent &event) noexcept
    {
        return std::holds_alternative<FallEvent>(event) ? ScenarioKind::Fall : ScenarioKind::Pothole;
    }

    double startTimeOf(const ScheduledEvent &event) noexcept
    {
        if (const auto *fall = std::get_if<FallEvent>(&event))
            return fall->startTime;
        return std::get_if<PotholeEvent>(&event)->startTime;
    }

    ScenarioMachine::ScenarioMachine(const ScenarioSchedule &schedule, random::RandomSource &rng, double now)
        : m_schedule(schedule), m_rng(rng), m_state(NormalRiding{scheduleNextEvent(now, schedule, rng)})
    {
    }

    ScenarioStep ScenarioMachine::advance(double now)
    {
        if (const auto *normal = std::get_if<NormalRiding>(&m_state))
        {
            if (now < startTimeOf(normal->next))
                return ScenarioStep{m_state, 0.0};

            m_state = activate(normal->next);
        }

        double start = 0.0;
        double duration = 1.0;
        if (const auto *fall = std::get_if<FallEvent>(&m_state))
        {
            start = fall->startTime;
            duration = FallEvent::kDuration;
        }
        else if (const auto *pothole = std::get_if<PotholeEvent>(&m_state))
        {
            start = pothole->startTime;
            duration = PotholeEvent::kDuration;
        }

        const double progress = std::clamp((now - start) / duration, 0.0, 1.0);
        m_progress = std::max(m_progress, progress);

        ScenarioStep step{m_state, m_progress};

        if (m_progress >= 1.0)
        {
            m_state = NormalRiding{scheduleNextEvent(now, m_schedule, m_rng)};
            m_progress = 0.0;
            ++m_completedEvents;
        }

        return step;
    }
} // namespace evtelemetry::inertial

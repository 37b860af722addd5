#pragma once

#include <EvTelemetrySim/Messages.hpp>
#include <InertialSensor/ScenarioState.hpp>
#include <RandomSource/RandomSource.hpp>
#include <VirtualTime/TimeSource.hpp>
#include <Eigen/Core>

namespace evtelemetry::inertial
{
    struct InertialConfig
    {
        float initialTemperature = 25.0f; // degC
        double turnProbability = 0.05;    // per tick while riding normally
        ScenarioSchedule schedule{};
    };

    /// Synthetic accelerometer/gyroscope with injected fall and pothole events.
    ///
    /// tick() advances simulation time and recomputes acceleration, rotation rate,
    /// temperature and scenario together; the getters only read that result and can be
    /// called in any order.
    ///
    /// Not thread-safe: a single owner must serialize calls.
    class InertialSensorSimulator
    {
    public:
        InertialSensorSimulator(const InertialConfig &config,
                                time::TimeSource &clock,
                                random::RandomSource &rng);

        /// Ticks by the time elapsed on the clock since the previous update.
        const MotionSample &update();

        /// Ticks by an explicit step (negative steps count as zero).
        const MotionSample &tick(double elapsedSeconds);

        [[nodiscard]] const MotionSample &sample() const noexcept { return m_sample; }
        [[nodiscard]] Eigen::Vector3f acceleration() const noexcept { return m_sample.acceleration; }
        [[nodiscard]] Eigen::Vector3f rotationRate() const noexcept { return m_sample.rotation_rate; }
        [[nodiscard]] float temperature() const noexcept { return m_sample.temperature; }

        [[nodiscard]] ScenarioKind scenario() const noexcept { return m_scenario.kind(); }
        [[nodiscard]] double scenarioProgress() const noexcept { return m_scenario.progress(); }
        [[nodiscard]] const ScenarioState &scenarioState() const noexcept { return m_scenario.state(); }
        [[nodiscard]] double simulationTime() const noexcept { return m_simTime; }

    private:
        struct Range
        {
            double lo;
            double hi;
        };

        void setAxes(Eigen::Vector3f &v, Range x, Range y, Range z, float scale = 1.0f);
        void renderNormal();
        void renderFall(const FallEvent &fall, double progress);
        void renderPothole(double progress);

        InertialConfig m_config;
        time::TimeSource &m_clock;
        random::RandomSource &m_rng;

        time::TimeSource::TimePoint m_lastUpdate{};
        double m_simTime{0.0};

        ScenarioMachine m_scenario;
        MotionSample m_sample{};
    };
} // namespace evtelemetry::inertial

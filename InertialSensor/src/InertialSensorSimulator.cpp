#include <InertialSensor/InertialSensorSimulator.hpp>

#include <algorithm>
#include <cmath>

namespace evtelemetry::inertial
{
    namespace
    {
        constexpr float kGravity = 9.8f; // m/s^2
        constexpr float kMaxLeanRad = 10.0f * 3.14159265358979323846f / 180.0f;

        constexpr float kMinTemperature = 15.0f;
        constexpr float kMaxTemperature = 45.0f;
    } // namespace

    InertialSensorSimulator::InertialSensorSimulator(const InertialConfig &config,
                                                     time::TimeSource &clock,
                                                     random::RandomSource &rng)
        : m_config(config), m_clock(clock), m_rng(rng), m_scenario(config.schedule, rng, 0.0)
    {
        m_lastUpdate = m_clock.now();
        m_sample.timestamp = m_lastUpdate;
        m_sample.temperature = std::clamp(config.initialTemperature, kMinTemperature, kMaxTemperature);
    }

    const MotionSample &InertialSensorSimulator::update()
    {
        const auto now = m_clock.now();
        const double elapsed = time::elapsedSeconds(m_lastUpdate, now);
        m_lastUpdate = now;

        return tick(elapsed);
    }

    const MotionSample &InertialSensorSimulator::tick(double elapsedSeconds)
    {
        const double elapsed = std::max(0.0, elapsedSeconds);
        m_simTime += elapsed;

        // Sensor die temperature drifts on its own.
        const float drift = static_cast<float>(m_rng.uniform(-0.05, 0.05) * elapsed);
        m_sample.temperature = std::clamp(m_sample.temperature + drift, kMinTemperature, kMaxTemperature);

        const ScenarioStep step = m_scenario.advance(m_simTime);

        if (const auto *fall = std::get_if<FallEvent>(&step.state))
            renderFall(*fall, step.progress);
        else if (std::holds_alternative<PotholeEvent>(step.state))
            renderPothole(step.progress);
        else
            renderNormal();

        m_sample.timestamp = m_clock.now();
        m_sample.scenario = kindOf(step.state);
        m_sample.scenario_progress = static_cast<float>(step.progress);

        return m_sample;
    }

    void InertialSensorSimulator::setAxes(Eigen::Vector3f &v, Range x, Range y, Range z, float scale)
    {
        // Draw x, y, z in order so a seeded source replays exactly.
        v.x() = static_cast<float>(m_rng.uniform(x.lo, x.hi)) * scale;
        v.y() = static_cast<float>(m_rng.uniform(y.lo, y.hi)) * scale;
        v.z() = static_cast<float>(m_rng.uniform(z.lo, z.hi)) * scale;
    }

    void InertialSensorSimulator::renderNormal()
    {
        // Road vibration
        setAxes(m_sample.acceleration, {-0.5, 0.5}, {-0.5, 0.5}, {-0.3, 0.3});
        m_sample.acceleration.z() += kGravity;
        setAxes(m_sample.rotation_rate, {-0.2, 0.2}, {-0.2, 0.2}, {-0.1, 0.1});

        if (m_rng.chance(m_config.turnProbability))
        {
            const float direction = m_rng.chance(0.5) ? 1.0f : -1.0f;
            m_sample.rotation_rate.z() = direction * static_cast<float>(m_rng.uniform(0.5, 1.5));
        }
    }

    void InertialSensorSimulator::renderFall(const FallEvent &fall, double progress)
    {
        if (progress < 0.1)
        {
            // Initial lean, tipping linearly up to 10 degrees.
            const float lean = static_cast<float>(progress / 0.1) * kMaxLeanRad;
            m_sample.acceleration = Eigen::Vector3f(kGravity * std::sin(lean), 0.0f, kGravity * std::cos(lean));
            m_sample.rotation_rate = Eigen::Vector3f(static_cast<float>(m_rng.uniform(0.5, 1.0)), 0.0f, 0.0f);
        }
        else if (progress < 0.3)
        {
            // Free fall: the accelerometer reads close to zero.
            setAxes(m_sample.acceleration, {-1.0, 1.0}, {-1.0, 1.0}, {-1.0, 1.0});
            setAxes(m_sample.rotation_rate, {2.0, 5.0}, {-2.0, 2.0}, {0.0, 0.0});
        }
        else if (progress < 0.4)
        {
            if (fall.sideImpact)
                setAxes(m_sample.acceleration, {25.0, 35.0}, {-5.0, 5.0}, {5.0, 10.0});
            else
                setAxes(m_sample.acceleration, {-5.0, 5.0}, {25.0, 35.0}, {5.0, 10.0});

            setAxes(m_sample.rotation_rate, {-10.0, 10.0}, {-10.0, 10.0}, {-10.0, 10.0});
        }
        else
        {
            // Lying still; gravity splits across x and z by the resting tilt.
            const float tilt = fall.restingTiltRad;
            m_sample.acceleration.x() = kGravity * std::sin(tilt);
            m_sample.acceleration.y() = static_cast<float>(m_rng.uniform(-1.0, 1.0));
            m_sample.acceleration.z() = kGravity * std::cos(tilt);
            setAxes(m_sample.rotation_rate, {-0.1, 0.1}, {-0.1, 0.1}, {-0.1, 0.1});
        }
    }

    void InertialSensorSimulator::renderPothole(double progress)
    {
        if (progress < 0.3)
        {
            // Front wheel drops in, pitching forward.
            setAxes(m_sample.acceleration, {-2.0, 2.0}, {-2.0, 2.0}, {-15.0, -5.0});
            m_sample.acceleration.z() -= kGravity;
            setAxes(m_sample.rotation_rate, {2.0, 4.0}, {-0.5, 0.5}, {-0.5, 0.5});
        }
        else if (progress < 0.7)
        {
            // Wheel climbs out.
            setAxes(m_sample.acceleration, {-3.0, 3.0}, {-3.0, 3.0}, {5.0, 15.0});
            m_sample.acceleration.z() += kGravity;
            setAxes(m_sample.rotation_rate, {-3.0, -1.0}, {-0.5, 0.5}, {-0.5, 0.5});
        }
        else
        {
            const float damping = static_cast<float>((1.0 - progress) * 2.0);
            setAxes(m_sample.acceleration, {-1.0, 1.0}, {-1.0, 1.0}, {-2.0, 2.0}, damping);
            m_sample.acceleration.z() += kGravity;
            setAxes(m_sample.rotation_rate, {-1.0, 1.0}, {-0.5, 0.5}, {-0.5, 0.5}, damping);
        }
    }
} // namespace evtelemetry::inertial

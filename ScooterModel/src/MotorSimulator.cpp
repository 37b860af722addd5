#include <ScooterModel/MotorSimulator.hpp>

#include <algorithm>
#include <cmath>

namespace evtelemetry::scooter
{
    namespace
    {
        constexpr double kPi = 3.14159265358979323846;
    }

    MotorSimulator::MotorSimulator(const MotorConfig &config, time::TimeSource &clock, random::RandomSource &rng)
        : m_config(config), m_clock(clock), m_rng(rng)
    {
        m_lastUpdate = clock.now();
        m_state.temperature = config.ambientTemperature;
        m_state.power = config.idlePowerW;
    }

    void MotorSimulator::setTargetSpeed(double kmh) noexcept
    {
        m_state.targetSpeed = std::clamp(kmh, 0.0, m_config.maxSpeedKmh);
    }

    telemetry::MotorState MotorSimulator::state()
    {
        const auto now = m_clock.now();
        const double dt = time::elapsedSeconds(m_lastUpdate, now);
        m_lastUpdate = now;

        // Ramp toward the target at a bounded rate.
        const double maxStep = m_config.accelerationKmhPerSec * dt;
        const double error = m_state.targetSpeed - m_state.speed;
        m_state.speed = std::max(0.0, m_state.speed + std::clamp(error, -maxStep, maxStep));

        const double v = m_state.speed;
        const double load = m_config.idlePowerW + m_config.rollingLossWPerKmh * v + m_config.dragWPerKmh2 * v * v;
        m_state.power = std::max(0.0, load + m_rng.uniform(-5.0, 5.0));

        // km/h -> m/min, divided by wheel circumference
        const double circumference = kPi * m_config.wheelDiameterM;
        m_state.rpm = (v * 1000.0 / 60.0) / circumference;

        const double omega = m_state.rpm * 2.0 * kPi / 60.0;
        m_state.torque = omega > 0.0 ? m_state.power / omega : 0.0;
        m_state.efficiency = std::clamp(90.0 - m_state.power / 50.0, 70.0, 90.0);

        const double target = m_config.ambientTemperature + m_config.heatingCPerW * m_state.power;
        const double alpha = std::min(1.0, dt / m_config.thermalTimeConstantSec);
        m_state.temperature += (target - m_state.temperature) * alpha;

        return m_state;
    }
} // namespace evtelemetry::scooter

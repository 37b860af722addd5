#include <ScooterModel/ThermalSimulator.hpp>

#include <algorithm>

namespace evtelemetry::scooter
{
    ThermalSimulator::ThermalSimulator(const ThermalConfig &config, const MotorSimulator &motor,
                                       time::TimeSource &clock, random::RandomSource &rng)
        : m_config(config), m_motor(motor), m_clock(clock), m_rng(rng)
    {
        m_lastUpdate = clock.now();
        m_state.ambient = config.ambientTemperature;
        m_state.controller = config.ambientTemperature;
    }

    telemetry::TemperatureState ThermalSimulator::state()
    {
        const auto now = m_clock.now();
        const double dt = time::elapsedSeconds(m_lastUpdate, now);
        m_lastUpdate = now;

        m_ambientOffset = std::clamp(m_ambientOffset + m_rng.uniform(-0.01, 0.01) * dt,
                                     -m_config.ambientDriftLimit, m_config.ambientDriftLimit);
        m_state.ambient = m_config.ambientTemperature + m_ambientOffset;

        const double target = m_state.ambient + m_config.controllerHeatingCPerW * m_motor.lastState().power;
        const double alpha = std::min(1.0, dt / m_config.thermalTimeConstantSec);
        m_state.controller += (target - m_state.controller) * alpha;

        return m_state;
    }
} // namespace evtelemetry::scooter

#include <ScooterModel/BatterySimulator.hpp>

#include <algorithm>
#include <cmath>

namespace evtelemetry::scooter
{
    BatterySimulator::BatterySimulator(const BatteryConfig &config, const MotorSimulator &motor, time::TimeSource &clock)
        : m_config(config), m_motor(motor), m_clock(clock)
    {
        m_lastUpdate = clock.now();
        m_state.level = std::clamp(config.initialLevel, 0.0, 100.0);
        m_state.capacityWh = config.capacityWh;
        m_state.voltage = config.nominalVoltage;
        m_state.temperature = config.ambientTemperature;
    }

    telemetry::BatteryState BatterySimulator::state()
    {
        const auto now = m_clock.now();
        const double dt = time::elapsedSeconds(m_lastUpdate, now);
        m_lastUpdate = now;
        const double hours = dt / 3600.0;

        // Open-circuit voltage sags roughly linearly from 100 % to empty.
        const double openCircuit = m_config.nominalVoltage * (0.85 + 0.3 * m_state.level / 100.0);

        if (m_state.charging)
        {
            m_state.level += m_config.chargeRatePercentPerHour * hours;
            m_state.current = -m_config.chargeCurrentA;
        }
        else
        {
            const double drawW = m_motor.lastState().power;
            if (m_config.capacityWh > 0.0)
                m_state.level -= (drawW * hours) / m_config.capacityWh * 100.0;
            m_state.current = openCircuit > 0.0 ? drawW / openCircuit : 0.0;
        }

        m_state.level = std::clamp(m_state.level, 0.0, 100.0);
        m_state.voltage = openCircuit - m_state.current * m_config.internalResistanceOhm;

        const double target = m_config.ambientTemperature + m_config.heatingCPerA * std::abs(m_state.current);
        const double alpha = std::min(1.0, dt / m_config.thermalTimeConstantSec);
        m_state.temperature += (target - m_state.temperature) * alpha;

        return m_state;
    }
} // namespace evtelemetry::scooter

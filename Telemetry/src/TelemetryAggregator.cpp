#include <Telemetry/TelemetryAggregator.hpp>

#include <algorithm>
#include <chrono>

namespace evtelemetry::telemetry
{
    TelemetryAggregator::TelemetryAggregator(BatteryProvider &battery,
                                             MotorProvider &motor,
                                             TemperatureProvider &temperature,
                                             time::TimeSource &clock)
        : m_battery(battery), m_motor(motor), m_temperature(temperature), m_clock(clock)
    {
        m_startTime = clock.now();
        m_lastUpdate = m_startTime;
    }

    TelemetrySnapshot TelemetryAggregator::aggregate()
    {
        const auto now = m_clock.now();
        const double elapsed = time::elapsedSeconds(m_lastUpdate, now);
        m_lastUpdate = now;

        // Motor first: the simulated battery drains by the motor's latest power.
        const MotorState motor = m_motor.state();
        const BatteryState battery = m_battery.state();
        const TemperatureState temps = m_temperature.state();

        if (elapsed > 0.0)
        {
            // W * h = Wh, km/h * h = km
            const double hours = elapsed / 3600.0;
            m_totalEnergy += motor.power * hours;
            m_totalDistance += motor.speed * hours;
        }

        const double whPerKm = m_totalDistance > 0.0 ? m_totalEnergy / m_totalDistance : 0.0;

        double range = 0.0;
        if (whPerKm > 0.0)
        {
            const double remainingWh = (battery.level / 100.0) * battery.capacityWh;
            range = remainingWh / whPerKm;
        }

        TelemetrySnapshot s{};
        s.timestamp = now;
        s.uptime = std::chrono::duration<double>(now - m_startTime).count();

        s.battery_level = battery.level;
        s.battery_voltage = battery.voltage;
        s.battery_current = battery.current;
        s.battery_temperature = battery.temperature;
        s.battery_charging = battery.charging;
        s.battery_capacity = battery.capacityWh;

        s.speed = motor.speed;
        s.target_speed = motor.targetSpeed;
        s.motor_power = motor.power;
        s.motor_temperature = motor.temperature;
        s.motor_rpm = motor.rpm;
        s.motor_torque = motor.torque;
        s.motor_efficiency = motor.efficiency;

        s.ambient_temperature = temps.ambient;
        s.controller_temperature = temps.controller;

        s.total_energy = m_totalEnergy;
        s.total_distance = m_totalDistance;
        s.energy_efficiency = whPerKm;
        s.estimated_range = range;
        s.system_health = systemHealth(battery, motor, temps);

        return s;
    }

    double TelemetryAggregator::systemHealth(const BatteryState &battery,
                                             const MotorState &motor,
                                             const TemperatureState &temperature) noexcept
    {
        double health = 100.0;

        if (battery.level < 20.0)
            health -= 20.0 - battery.level;

        if (battery.temperature > 40.0)
            health -= (battery.temperature - 40.0) * 2.0;

        if (motor.temperature > 60.0)
            health -= (motor.temperature - 60.0) * 1.5;

        if (temperature.controller > 70.0)
            health -= (temperature.controller - 70.0) * 1.5;

        return std::clamp(health, 0.0, 100.0);
    }
} // namespace evtelemetry::telemetry

#pragma once

#include <EvTelemetrySim/Messages.hpp>
#include <Telemetry/TelemetryProviders.hpp>
#include <VirtualTime/TimeSource.hpp>

namespace evtelemetry::telemetry
{
    /// Fuses battery, motor and temperature provider states into one TelemetrySnapshot.
    ///
    /// Every aggregate() call integrates motor power and speed over the time since the
    /// previous call into total energy (Wh) and distance (km), then derives efficiency,
    /// range and a 0-100 health score. Not thread-safe.
    class TelemetryAggregator
    {
    public:
        TelemetryAggregator(BatteryProvider &battery,
                            MotorProvider &motor,
                            TemperatureProvider &temperature,
                            time::TimeSource &clock);

        TelemetrySnapshot aggregate();

        [[nodiscard]] double totalEnergyWh() const noexcept { return m_totalEnergy; }
        [[nodiscard]] double totalDistanceKm() const noexcept { return m_totalDistance; }

        /// 100 minus penalties for low charge and hot battery, motor or controller; clamped to [0, 100].
        [[nodiscard]] static double systemHealth(const BatteryState &battery,
                                                 const MotorState &motor,
                                                 const TemperatureState &temperature) noexcept;

    private:
        BatteryProvider &m_battery;
        MotorProvider &m_motor;
        TemperatureProvider &m_temperature;
        time::TimeSource &m_clock;

        time::TimeSource::TimePoint m_startTime{};
        time::TimeSource::TimePoint m_lastUpdate{};

        double m_totalEnergy{0.0};   // Wh
        double m_totalDistance{0.0}; // km
    };
} // namespace evtelemetry::telemetry

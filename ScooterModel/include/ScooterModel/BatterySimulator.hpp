#pragma once

#include <ScooterModel/MotorSimulator.hpp>
#include <Telemetry/TelemetryProviders.hpp>
#include <VirtualTime/TimeSource.hpp>

namespace evtelemetry::scooter
{
    struct BatteryConfig
    {
        double capacityWh = 360.0; // 36 V x 10 Ah pack
        double nominalVoltage = 36.0;
        double initialLevel = 100.0;
        double internalResistanceOhm = 0.15;
        double chargeRatePercentPerHour = 25.0;
        double chargeCurrentA = 2.5;
        double ambientTemperature = 25.0;
        double heatingCPerA = 0.6;
        double thermalTimeConstantSec = 120.0;
    };

    // Pack drained by the motor's last reported power draw, so poll the motor first.
    class BatterySimulator : public telemetry::BatteryProvider
    {
    public:
        BatterySimulator(const BatteryConfig &config, const MotorSimulator &motor, time::TimeSource &clock);

        telemetry::BatteryState state() override;

        void setCharging(bool charging) noexcept { m_state.charging = charging; }

    private:
        BatteryConfig m_config;
        const MotorSimulator &m_motor;
        time::TimeSource &m_clock;

        time::TimeSource::TimePoint m_lastUpdate{};
        telemetry::BatteryState m_state{};
    };
} // namespace evtelemetry::scooter

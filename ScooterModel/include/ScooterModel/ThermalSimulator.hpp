#pragma once

#include <RandomSource/RandomSource.hpp>
#include <ScooterModel/MotorSimulator.hpp>
#include <Telemetry/TelemetryProviders.hpp>
#include <VirtualTime/TimeSource.hpp>

namespace evtelemetry::scooter
{
    struct ThermalConfig
    {
        double ambientTemperature = 25.0;
        double ambientDriftLimit = 5.0;     // ambient wanders within +/- this band
        double controllerHeatingCPerW = 0.1;
        double thermalTimeConstantSec = 30.0;
    };

    // Ambient air plus a motor controller that warms with load.
    class ThermalSimulator : public telemetry::TemperatureProvider
    {
    public:
        ThermalSimulator(const ThermalConfig &config, const MotorSimulator &motor,
                         time::TimeSource &clock, random::RandomSource &rng);

        telemetry::TemperatureState state() override;

    private:
        ThermalConfig m_config;
        const MotorSimulator &m_motor;
        time::TimeSource &m_clock;
        random::RandomSource &m_rng;

        time::TimeSource::TimePoint m_lastUpdate{};
        double m_ambientOffset{0.0};
        telemetry::TemperatureState m_state{};
    };
} // namespace evtelemetry::scooter

#pragma once

#include <RandomSource/RandomSource.hpp>
#include <Telemetry/TelemetryProviders.hpp>
#include <VirtualTime/TimeSource.hpp>

namespace evtelemetry::scooter
{
    struct MotorConfig
    {
        double maxSpeedKmh = 25.0;
        double accelerationKmhPerSec = 5.0;
        double idlePowerW = 20.0;
        double rollingLossWPerKmh = 4.0;
        double dragWPerKmh2 = 0.35;
        double wheelDiameterM = 0.254; // 10 inch
        double ambientTemperature = 25.0;
        double heatingCPerW = 0.08;    // steady-state rise per watt
        double thermalTimeConstantSec = 60.0;
    };

    // Hub motor that ramps toward a target speed; power follows a rolling + drag load model.
    class MotorSimulator : public telemetry::MotorProvider
    {
    public:
        MotorSimulator(const MotorConfig &config, time::TimeSource &clock, random::RandomSource &rng);

        telemetry::MotorState state() override;

        /// Clamped to [0, maxSpeedKmh].
        void setTargetSpeed(double kmh) noexcept;

        [[nodiscard]] const telemetry::MotorState &lastState() const noexcept { return m_state; }

    private:
        MotorConfig m_config;
        time::TimeSource &m_clock;
        random::RandomSource &m_rng;

        time::TimeSource::TimePoint m_lastUpdate{};
        telemetry::MotorState m_state{};
    };
} // namespace evtelemetry::scooter

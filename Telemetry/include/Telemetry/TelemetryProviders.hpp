#pragma once

namespace evtelemetry::telemetry
{
    struct BatteryState
    {
        double level{100.0};       // %, [0, 100]
        double voltage{0.0};       // V
        double current{0.0};       // A
        double temperature{25.0};  // degC
        bool charging{false};
        double capacityWh{0.0};    // stored energy at 100 %
    };

    struct MotorState
    {
        double power{0.0};        // W
        double speed{0.0};        // km/h
        double targetSpeed{0.0};  // km/h
        double temperature{25.0}; // degC
        double rpm{0.0};
        double torque{0.0};       // Nm
        double efficiency{0.0};   // %
    };

    struct TemperatureState
    {
        double ambient{25.0};    // degC
        double controller{25.0}; // degC
    };

    // Synchronous state providers polled by TelemetryAggregator. Implementations are
    // trusted collaborators; the aggregator does not second-guess their values.
    class BatteryProvider
    {
    public:
        virtual ~BatteryProvider() = default;
        virtual BatteryState state() = 0;
    };

    class MotorProvider
    {
    public:
        virtual ~MotorProvider() = default;
        virtual MotorState state() = 0;
    };

    class TemperatureProvider
    {
    public:
        virtual ~TemperatureProvider() = default;
        virtual TemperatureState state() = 0;
    };
} // namespace evtelemetry::telemetry

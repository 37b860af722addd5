#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <Eigen/Core>

namespace evtelemetry
{
    enum class ScenarioKind
    {
        Normal,
        Fall,
        Pothole
    };

    // One BME680-style reading. gas_resistance is only present when gas measurement
    // is enabled and the heater settings make the reading heat-stable.
    struct EnvironmentalSample
    {
        std::chrono::steady_clock::time_point timestamp;

        double temperature{0.0};  // degC
        double pressure{0.0};     // hPa
        double humidity{0.0};     // %RH, [0, 100]
        std::optional<double> gas_resistance; // Ohm
        bool heat_stable{false};
    };

    // One MPU6050-style reading plus the scenario that shaped it.
    struct MotionSample
    {
        std::chrono::steady_clock::time_point timestamp;

        Eigen::Vector3f acceleration{0.0f, 0.0f, 9.8f}; // m/s^2
        Eigen::Vector3f rotation_rate{Eigen::Vector3f::Zero()}; // rad/s
        float temperature{25.0f}; // degC, [15, 45]

        ScenarioKind scenario{ScenarioKind::Normal};
        float scenario_progress{0.0f};
    };

    // Fused vehicle state produced by one TelemetryAggregator::aggregate() call.
    struct TelemetrySnapshot
    {
        std::chrono::steady_clock::time_point timestamp;
        double uptime{0.0}; // seconds

        // Battery
        double battery_level{0.0};       // %
        double battery_voltage{0.0};     // V
        double battery_current{0.0};     // A
        double battery_temperature{0.0}; // degC
        bool battery_charging{false};
        double battery_capacity{0.0};    // Wh

        // Motor
        double speed{0.0};        // km/h
        double target_speed{0.0}; // km/h
        double motor_power{0.0};  // W
        double motor_temperature{0.0};
        double motor_rpm{0.0};
        double motor_torque{0.0};     // Nm
        double motor_efficiency{0.0}; // %

        // Temperatures
        double ambient_temperature{0.0};
        double controller_temperature{0.0};

        // Derived
        double total_energy{0.0};      // Wh
        double total_distance{0.0};    // km
        double energy_efficiency{0.0}; // Wh/km
        double estimated_range{0.0};   // km
        double system_health{100.0};   // [0, 100]
    };

    enum class SystemEventType
    {
        ScenarioStarted,
        ScenarioEnded,
        CollectionMilestone,
        CollectionFinished
    };

    // Represents high-level system events for logging.
    struct SystemEvent
    {
        std::chrono::steady_clock::time_point timestamp;
        SystemEventType type{SystemEventType::ScenarioStarted};
        std::string description;
    };

    [[nodiscard]] inline const char *toString(ScenarioKind kind) noexcept
    {
        switch (kind)
        {
        case ScenarioKind::Fall:
            return "fall";
        case ScenarioKind::Pothole:
            return "pothole";
        default:
            return "normal";
        }
    }
} // namespace evtelemetry

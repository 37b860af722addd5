#include <Serialization/JsonSerializer.hpp>
#include <chrono>
#include <iomanip>
#include <limits>
#include <sstream>

namespace evtelemetry::serialization
{
    namespace
    {
        std::string escape(const std::string &text)
        {
            std::string out;
            out.reserve(text.size());
            for (const char c : text)
            {
                switch (c)
                {
                case '"':
                    out += "\\\"";
                    break;
                case '\\':
                    out += "\\\\";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                default:
                    out += c;
                }
            }
            return out;
        }

        constexpr int kDoubleDigits = std::numeric_limits<double>::digits10;
        constexpr int kFloatDigits = std::numeric_limits<float>::digits10;

        double secondsSinceEpoch(std::chrono::steady_clock::time_point t)
        {
            return std::chrono::duration<double>(t.time_since_epoch()).count();
        }

        const char *boolText(bool value)
        {
            return value ? "true" : "false";
        }
    } // namespace

    std::string JsonSerializer::toJson(const EnvironmentalSample &s)
    {
        std::ostringstream oss;
        oss << std::setprecision(kDoubleDigits)
            << "{"
            << "\"kind\":\"environment\","
            << "\"timestamp\":" << secondsSinceEpoch(s.timestamp) << ","
            << "\"temperature\":" << s.temperature << ","
            << "\"pressure\":" << s.pressure << ","
            << "\"humidity\":" << s.humidity << ",";
        if (s.gas_resistance)
            oss << "\"gas_resistance\":" << *s.gas_resistance << ",";
        oss << "\"heat_stable\":" << boolText(s.heat_stable)
            << "}";
        return oss.str();
    }

    std::string JsonSerializer::toJson(const MotionSample &m)
    {
        std::ostringstream oss;
        oss << std::setprecision(kDoubleDigits)
            << "{"
            << "\"kind\":\"motion\","
            << "\"timestamp\":" << secondsSinceEpoch(m.timestamp) << ","
            << std::setprecision(kFloatDigits)
            << "\"acc\":[" << m.acceleration.x() << "," << m.acceleration.y() << "," << m.acceleration.z() << "],"
            << "\"gyro\":[" << m.rotation_rate.x() << "," << m.rotation_rate.y() << "," << m.rotation_rate.z() << "],"
            << "\"temp\":" << m.temperature << ","
            << "\"scenario\":\"" << toString(m.scenario) << "\","
            << "\"progress\":" << m.scenario_progress
            << "}";
        return oss.str();
    }

    std::string JsonSerializer::toJson(const TelemetrySnapshot &t)
    {
        std::ostringstream oss;
        oss << std::setprecision(kDoubleDigits)
            << "{"
            << "\"kind\":\"telemetry\","
            << "\"timestamp\":" << secondsSinceEpoch(t.timestamp) << ","
            << "\"uptime\":" << t.uptime << ","
            << "\"battery_level\":" << t.battery_level << ","
            << "\"battery_voltage\":" << t.battery_voltage << ","
            << "\"battery_current\":" << t.battery_current << ","
            << "\"battery_temperature\":" << t.battery_temperature << ","
            << "\"battery_charging\":" << boolText(t.battery_charging) << ","
            << "\"battery_capacity\":" << t.battery_capacity << ","
            << "\"speed\":" << t.speed << ","
            << "\"target_speed\":" << t.target_speed << ","
            << "\"motor_power\":" << t.motor_power << ","
            << "\"motor_temperature\":" << t.motor_temperature << ","
            << "\"motor_rpm\":" << t.motor_rpm << ","
            << "\"motor_torque\":" << t.motor_torque << ","
            << "\"motor_efficiency\":" << t.motor_efficiency << ","
            << "\"ambient_temperature\":" << t.ambient_temperature << ","
            << "\"controller_temperature\":" << t.controller_temperature << ","
            << "\"total_energy_consumed\":" << t.total_energy << ","
            << "\"total_distance\":" << t.total_distance << ","
            << "\"energy_efficiency\":" << t.energy_efficiency << ","
            << "\"estimated_range\":" << t.estimated_range << ","
            << "\"system_health\":" << t.system_health
            << "}";
        return oss.str();
    }

    std::string JsonSerializer::toJson(const SystemEvent &e)
    {
        std::ostringstream oss;
        oss << std::setprecision(kDoubleDigits)
            << "{"
            << "\"kind\":\"event\","
            << "\"timestamp\":" << secondsSinceEpoch(e.timestamp) << ","
            << "\"type\":" << static_cast<int>(e.type) << ","
            << "\"desc\":\"" << escape(e.description) << "\""
            << "}";
        return oss.str();
    }
} // namespace evtelemetry::serialization

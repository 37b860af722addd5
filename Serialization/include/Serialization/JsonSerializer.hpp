#pragma once
#include <EvTelemetrySim/Messages.hpp>
#include <string>

namespace evtelemetry::serialization
{
    // Single-line JSON renderings tagged with a "kind" field.
    struct JsonSerializer
    {
        static std::string toJson(const EnvironmentalSample &s);
        static std::string toJson(const MotionSample &m);
        static std::string toJson(const TelemetrySnapshot &t);
        static std::string toJson(const SystemEvent &e);
    };
} // namespace evtelemetry::serialization

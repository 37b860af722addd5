#include <DataLogger/DataLogger.hpp>
#include <Serialization/JsonSerializer.hpp>
#include <iostream>

namespace evtelemetry::logging
{
    using serialization::JsonSerializer;

    DataLogger::DataLogger(const LoggerConfig &config, bus::CommunicationBus &bus) : m_config(config), m_bus(bus) {}

    bool DataLogger::start()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running)
            return true;

        m_file.open(m_config.outputPath, std::ios::out | std::ios::trunc);
        if (!m_file.is_open())
        {
            std::cerr << "[DataLogger] Failed to open " << m_config.outputPath << "\n";
            return false;
        }

        m_running = true;

        // Handlers stay registered for the bus lifetime; write() drops records while stopped.
        if (m_subscribed)
            return true;
        m_subscribed = true;

        if (m_config.logEnvironmentSamples)
            m_bus.subscribe([this](const evtelemetry::EnvironmentalSample &s)
                            { this->write("EnvironmentalSample", JsonSerializer::toJson(s)); });

        if (m_config.logMotionSamples)
            m_bus.subscribe([this](const evtelemetry::MotionSample &m)
                            { this->write("MotionSample", JsonSerializer::toJson(m)); });

        if (m_config.logTelemetry)
            m_bus.subscribe([this](const evtelemetry::TelemetrySnapshot &t)
                            { this->write("TelemetrySnapshot", JsonSerializer::toJson(t)); });

        if (m_config.logSystemEvents)
            m_bus.subscribe([this](const evtelemetry::SystemEvent &e)
                            { this->write("SystemEvent", JsonSerializer::toJson(e)); });

        return true;
    }

    void DataLogger::stop()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running)
            return;
        m_running = false;

        if (m_file.is_open())
            m_file.close();
    }

    void DataLogger::write(const char *tag, const std::string &json)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running)
            return;

        m_file << "[" << tag << "] " << json << "\n";
        m_file.flush();
        ++m_records;
    }

} // namespace evtelemetry::logging

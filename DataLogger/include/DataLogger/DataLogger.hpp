#pragma once

#include <CommunicationBus/CommunicationBus.hpp>
#include <atomic>
#include <fstream>
#include <mutex>
#include <string>

namespace evtelemetry::logging
{
    struct LoggerConfig
    {
        std::string outputPath;
        bool logEnvironmentSamples = true;
        bool logMotionSamples = true;
        bool logTelemetry = true;
        bool logSystemEvents = true;
    };

    // Records bus traffic as "[Tag] {json}" lines.
    class DataLogger
    {
    public:
        DataLogger(const LoggerConfig &config,
                   bus::CommunicationBus &bus);

        /// Opens (truncating) the output file and subscribes. Returns false if the file cannot be opened.
        [[nodiscard]] bool start();
        void stop();

        [[nodiscard]] std::size_t recordsWritten() const noexcept { return m_records.load(); }

    private:
        void write(const char *tag, const std::string &json);

        LoggerConfig m_config;
        bus::CommunicationBus &m_bus;

        std::ofstream m_file;
        std::mutex m_mutex;

        bool m_running = false;
        bool m_subscribed = false;
        std::atomic<std::size_t> m_records{0};
    };
} // namespace evtelemetry::logging

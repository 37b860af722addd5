#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <CommunicationBus/CommunicationBus.hpp>
#include <EnvironmentalSensor/EnvironmentalSensorSimulator.hpp>
#include <InertialSensor/InertialSensorSimulator.hpp>
#include <Telemetry/TelemetryAggregator.hpp>
#include <VirtualTime/TimeSource.hpp>

namespace evtelemetry::collector
{
    struct CollectorConfig
    {
        std::chrono::milliseconds collectionInterval{10000};
        std::optional<std::chrono::milliseconds> duration; // run until stop() when empty

        bool collectEnvironment = true;
        bool collectMotion = true;
        bool collectTelemetry = true;

        std::size_t progressEvery = 10; // cycles between progress reports, 0 disables
    };

    struct CollectorSources
    {
        environment::EnvironmentalSensorSimulator *environment = nullptr;
        inertial::InertialSensorSimulator *inertial = nullptr;
        telemetry::TelemetryAggregator *telemetry = nullptr;
    };

    // Drives the simulators on a fixed interval and publishes every reading on the
    // CommunicationBus. The collector owns the simulators while it runs; nothing else
    // may call them until stop() returns.
    class SensorCollector
    {
    public:
        /// Throws std::invalid_argument for a non-positive interval or when no enabled source is attached.
        SensorCollector(const CollectorConfig &config,
                        const CollectorSources &sources,
                        time::TimeSource &clock,
                        bus::CommunicationBus &bus);
        ~SensorCollector();

        void start();
        void stop();

        /// Pulls one reading from each enabled source and publishes it. Returns the number published.
        std::size_t collectOnce();

        [[nodiscard]] std::size_t readingsCollected() const noexcept { return m_readings.load(); }
        [[nodiscard]] std::size_t cyclesCompleted() const noexcept { return m_cycles.load(); }

        /// True once a configured duration has elapsed.
        [[nodiscard]] bool finished() const noexcept { return m_finished.load(); }

    private:
        void workerLoop(std::stop_token st);
        void publishEvent(SystemEventType type, const std::string &description);
        void trackScenario(const MotionSample &sample);

        CollectorConfig m_config;
        CollectorSources m_sources;
        time::TimeSource &m_clock;
        bus::CommunicationBus &m_bus;

        std::jthread m_worker;
        std::atomic<bool> m_running{false};
        std::atomic<bool> m_finished{false};

        std::mutex m_waitMutex;
        std::condition_variable_any m_wakeup;

        std::atomic<std::size_t> m_readings{0};
        std::atomic<std::size_t> m_cycles{0};
        ScenarioKind m_lastScenario{ScenarioKind::Normal};
    };
} // namespace evtelemetry::collector

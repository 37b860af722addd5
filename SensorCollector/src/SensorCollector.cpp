#include <SensorCollector/SensorCollector.hpp>

#include <iostream>
#include <stdexcept>

namespace evtelemetry::collector
{
    SensorCollector::SensorCollector(const CollectorConfig &config,
                                     const CollectorSources &sources,
                                     time::TimeSource &clock,
                                     bus::CommunicationBus &bus)
        : m_config(config), m_sources(sources), m_clock(clock), m_bus(bus)
    {
        if (config.collectionInterval <= std::chrono::milliseconds::zero())
            throw std::invalid_argument("SensorCollector: collection interval must be positive");

        const bool anySource = (config.collectEnvironment && sources.environment) ||
                               (config.collectMotion && sources.inertial) ||
                               (config.collectTelemetry && sources.telemetry);
        if (!anySource)
            throw std::invalid_argument("SensorCollector: no enabled source attached");
    }

    SensorCollector::~SensorCollector()
    {
        stop();
    }

    void SensorCollector::start()
    {
        bool expected = false;
        if (!m_running.compare_exchange_strong(expected, true))
            return; // already running

        m_finished = false;
        m_worker = std::jthread([this](std::stop_token st)
                                { workerLoop(st); });
    }

    void SensorCollector::stop()
    {
        if (!m_running.exchange(false))
            return;

        if (m_worker.joinable())
        {
            m_worker.request_stop();
            m_worker.join();
        }
    }

    std::size_t SensorCollector::collectOnce()
    {
        std::size_t published = 0;

        if (m_config.collectEnvironment && m_sources.environment)
        {
            m_bus.publish(m_sources.environment->sample());
            ++published;
        }

        if (m_config.collectMotion && m_sources.inertial)
        {
            const MotionSample &motion = m_sources.inertial->update();
            trackScenario(motion);
            m_bus.publish(motion);
            ++published;
        }

        if (m_config.collectTelemetry && m_sources.telemetry)
        {
            m_bus.publish(m_sources.telemetry->aggregate());
            ++published;
        }

        const std::size_t total = m_readings += published;
        const std::size_t cycles = ++m_cycles;

        if (m_config.progressEvery > 0 && cycles % m_config.progressEvery == 0)
        {
            const std::string msg = "Collected " + std::to_string(total) + " readings so far";
            std::cout << "[SensorCollector] " << msg << "\n";
            publishEvent(SystemEventType::CollectionMilestone, msg);
        }

        return published;
    }

    void SensorCollector::trackScenario(const MotionSample &sample)
    {
        if (sample.scenario == m_lastScenario)
            return;

        // A long gap can take one event straight into the next.
        if (m_lastScenario != ScenarioKind::Normal)
            publishEvent(SystemEventType::ScenarioEnded, std::string(toString(m_lastScenario)) + " ended");
        if (sample.scenario != ScenarioKind::Normal)
            publishEvent(SystemEventType::ScenarioStarted, std::string(toString(sample.scenario)) + " started");

        m_lastScenario = sample.scenario;
    }

    void SensorCollector::publishEvent(SystemEventType type, const std::string &description)
    {
        SystemEvent evt{};
        evt.timestamp = m_clock.now();
        evt.type = type;
        evt.description = description;
        m_bus.publish(evt);
    }

    void SensorCollector::workerLoop(std::stop_token st)
    {
        const auto startedAt = m_clock.now();

        while (!st.stop_requested())
        {
            if (m_config.duration && m_clock.now() - startedAt >= *m_config.duration)
            {
                std::cout << "[SensorCollector] Reached collection duration of "
                          << std::chrono::duration<double>(*m_config.duration).count() << " seconds\n";
                m_finished = true;
                break;
            }

            collectOnce();

            // Sleep one interval, waking early on stop().
            std::unique_lock<std::mutex> lock(m_waitMutex);
            m_wakeup.wait_for(lock, st, m_config.collectionInterval, []
                              { return false; });
        }

        const std::string summary = "Collection complete. Collected " + std::to_string(m_readings.load()) + " readings.";
        std::cout << "[SensorCollector] " << summary << "\n";
        publishEvent(SystemEventType::CollectionFinished, summary);
    }
} // namespace evtelemetry::collector

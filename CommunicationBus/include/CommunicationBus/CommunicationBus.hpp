#pragma once

#include <functional>
#include <queue>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <thread>

#include <EvTelemetrySim/Messages.hpp>

namespace evtelemetry::bus
{
    struct BusConfig
    {
        bool dropOnOverflow = false;
        std::size_t maxQueueSizePerType = 1024;
    };

    class CommunicationBus
    {
    public:
        using EnvironmentalSampleHandler = std::function<void(const evtelemetry::EnvironmentalSample &)>;
        using MotionSampleHandler = std::function<void(const evtelemetry::MotionSample &)>;
        using TelemetrySnapshotHandler = std::function<void(const evtelemetry::TelemetrySnapshot &)>;
        using SystemEventHandler = std::function<void(const evtelemetry::SystemEvent &)>;

        explicit CommunicationBus(const BusConfig &config = {});
        ~CommunicationBus();

        void start();
        void stop();

        // Publish API - thread-safe
        void publish(const evtelemetry::EnvironmentalSample &sample);
        void publish(const evtelemetry::MotionSample &sample);
        void publish(const evtelemetry::TelemetrySnapshot &snapshot);
        void publish(const evtelemetry::SystemEvent &event);

        // Subscription API - call before start()
        void subscribe(EnvironmentalSampleHandler handler);
        void subscribe(MotionSampleHandler handler);
        void subscribe(TelemetrySnapshotHandler handler);
        void subscribe(SystemEventHandler handler);

        // Messages rejected because their queue was full.
        [[nodiscard]] std::size_t droppedMessages() const noexcept { return m_dropped.load(); }

    private:
        template <typename Message>
        void enqueue(std::queue<Message> &queue, const Message &message);

        // Single worker, deterministic fan-out in publish order per type
        void workerLoop(std::stop_token st);

        BusConfig m_config{};

        // Queues for each message type
        std::queue<evtelemetry::EnvironmentalSample> m_environmentalQueue;
        std::queue<evtelemetry::MotionSample> m_motionQueue;
        std::queue<evtelemetry::TelemetrySnapshot> m_telemetryQueue;
        std::queue<evtelemetry::SystemEvent> m_systemEventQueue;

        // Subscribers per message type
        std::vector<EnvironmentalSampleHandler> m_environmentalHandlers;
        std::vector<MotionSampleHandler> m_motionHandlers;
        std::vector<TelemetrySnapshotHandler> m_telemetryHandlers;
        std::vector<SystemEventHandler> m_systemEventHandlers;

        // Synchronization
        std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_hasWork{false};

        std::atomic<bool> m_running{false};
        std::atomic<std::size_t> m_dropped{0};
        std::jthread m_worker;
    }; // class CommunicationBus
} // namespace evtelemetry::bus

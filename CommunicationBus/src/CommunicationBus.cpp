#include <CommunicationBus/CommunicationBus.hpp>

namespace evtelemetry::bus
{
    namespace
    {
        template <typename Message, typename Handler>
        void dispatch(std::queue<Message> &pending, const std::vector<Handler> &handlers)
        {
            while (!pending.empty())
            {
                const auto &msg = pending.front();
                for (const auto &h : handlers)
                {
                    if (h)
                    {
                        h(msg);
                    }
                }
                pending.pop();
            }
        }
    } // namespace

    CommunicationBus::CommunicationBus(const BusConfig &config) : m_config(config) {}

    CommunicationBus::~CommunicationBus()
    {
        stop();
    }

    // Start worker thread
    void CommunicationBus::start()
    {
        bool expected = false;

        // Only the first caller flips m_running and spawns the worker.
        if (!m_running.compare_exchange_strong(expected, true))
        {
            // already running
            return;
        }

        m_worker = std::jthread([this](std::stop_token st)
                                { workerLoop(st); });
    }

    void CommunicationBus::stop()
    {
        if (!m_worker.joinable())
            return;

        m_worker.request_stop();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_hasWork = true; // wake up worker to exit
        }
        m_cv.notify_one();
        m_worker.join();
        m_running = false;
    }

    template <typename Message>
    void CommunicationBus::enqueue(std::queue<Message> &queue, const Message &message)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_config.dropOnOverflow && queue.size() >= m_config.maxQueueSizePerType)
            {
                ++m_dropped;
            }
            else
            {
                queue.push(message);
            }

            m_hasWork = true;
        }
        m_cv.notify_one();
    }

    void CommunicationBus::publish(const evtelemetry::EnvironmentalSample &sample)
    {
        enqueue(m_environmentalQueue, sample);
    }

    void CommunicationBus::publish(const evtelemetry::MotionSample &sample)
    {
        enqueue(m_motionQueue, sample);
    }

    void CommunicationBus::publish(const evtelemetry::TelemetrySnapshot &snapshot)
    {
        enqueue(m_telemetryQueue, snapshot);
    }

    void CommunicationBus::publish(const evtelemetry::SystemEvent &event)
    {
        enqueue(m_systemEventQueue, event);
    }

    void CommunicationBus::subscribe(EnvironmentalSampleHandler handler)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_environmentalHandlers.emplace_back(std::move(handler));
    }
    void CommunicationBus::subscribe(MotionSampleHandler handler)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_motionHandlers.emplace_back(std::move(handler));
    }
    void CommunicationBus::subscribe(TelemetrySnapshotHandler handler)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_telemetryHandlers.emplace_back(std::move(handler));
    }
    void CommunicationBus::subscribe(SystemEventHandler handler)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_systemEventHandlers.emplace_back(std::move(handler));
    }

    void CommunicationBus::workerLoop(std::stop_token st)
    {
        bool stopping = false;
        while (!stopping)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [&]
                      { return m_hasWork || st.stop_requested(); });

            // Messages queued before stop() are still delivered.
            stopping = st.stop_requested();

            std::queue<evtelemetry::EnvironmentalSample> environmental;
            std::queue<evtelemetry::MotionSample> motion;
            std::queue<evtelemetry::TelemetrySnapshot> telemetry;
            std::queue<evtelemetry::SystemEvent> systemEvents;

            environmental.swap(m_environmentalQueue);
            motion.swap(m_motionQueue);
            telemetry.swap(m_telemetryQueue);
            systemEvents.swap(m_systemEventQueue);

            m_hasWork = false;
            lock.unlock();

            dispatch(environmental, m_environmentalHandlers);
            dispatch(motion, m_motionHandlers);
            dispatch(telemetry, m_telemetryHandlers);
            dispatch(systemEvents, m_systemEventHandlers);

        } // while (!stopping)
    }
} // namespace evtelemetry::bus

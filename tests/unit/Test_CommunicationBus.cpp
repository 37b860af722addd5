#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <CommunicationBus/CommunicationBus.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using Catch::Approx;

namespace
{
    bool waitFor(const std::function<bool()> &predicate, std::chrono::milliseconds timeout)
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
                return true;
            std::this_thread::sleep_for(1ms);
        }
        return predicate();
    }
} // namespace

TEST_CASE("CommunicationBus fans out messages to all subscribers", "[CommunicationBus]")
{
    evtelemetry::bus::CommunicationBus bus;

    std::mutex m;
    std::atomic<int> environmentalCount{0};
    std::atomic<int> motionCount{0};
    std::atomic<int> telemetryCount{0};
    std::atomic<int> eventCount{0};
    std::atomic<int> secondMotionCount{0};

    double capturedHumidity = 0.0;
    evtelemetry::ScenarioKind capturedScenario = evtelemetry::ScenarioKind::Normal;
    double capturedRange = 0.0;
    std::string capturedDescription;

    bus.subscribe([&](const evtelemetry::EnvironmentalSample &s)
                  {
                      std::lock_guard<std::mutex> lock(m);
                      capturedHumidity = s.humidity;
                      environmentalCount++;
                  });
    bus.subscribe([&](const evtelemetry::MotionSample &s)
                  {
                      std::lock_guard<std::mutex> lock(m);
                      capturedScenario = s.scenario;
                      motionCount++;
                  });
    bus.subscribe([&](const evtelemetry::MotionSample &)
                  { secondMotionCount++; });
    bus.subscribe([&](const evtelemetry::TelemetrySnapshot &s)
                  {
                      std::lock_guard<std::mutex> lock(m);
                      capturedRange = s.estimated_range;
                      telemetryCount++;
                  });
    bus.subscribe([&](const evtelemetry::SystemEvent &e)
                  {
                      std::lock_guard<std::mutex> lock(m);
                      capturedDescription = e.description;
                      eventCount++;
                  });

    bus.start();

    evtelemetry::EnvironmentalSample env{};
    env.humidity = 55.5;
    bus.publish(env);

    evtelemetry::MotionSample motion{};
    motion.scenario = evtelemetry::ScenarioKind::Pothole;
    bus.publish(motion);

    evtelemetry::TelemetrySnapshot snapshot{};
    snapshot.estimated_range = 18.0;
    bus.publish(snapshot);

    evtelemetry::SystemEvent evt{};
    evt.type = evtelemetry::SystemEventType::ScenarioStarted;
    evt.description = "pothole started";
    bus.publish(evt);

    const bool delivered = waitFor(
        [&]
        {
            return environmentalCount.load() == 1 && motionCount.load() == 1 &&
                   secondMotionCount.load() == 1 && telemetryCount.load() == 1 &&
                   eventCount.load() == 1;
        },
        200ms);

    bus.stop();

    REQUIRE(delivered);
    std::lock_guard<std::mutex> lock(m);
    REQUIRE(capturedHumidity == Approx(55.5));
    REQUIRE(capturedScenario == evtelemetry::ScenarioKind::Pothole);
    REQUIRE(capturedRange == Approx(18.0));
    REQUIRE(capturedDescription == "pothole started");
    REQUIRE(bus.droppedMessages() == 0);
}

TEST_CASE("CommunicationBus delivers each type in publish order", "[CommunicationBus]")
{
    evtelemetry::bus::CommunicationBus bus;

    std::mutex m;
    std::vector<double> uptimes;
    bus.subscribe([&](const evtelemetry::TelemetrySnapshot &s)
                  {
                      std::lock_guard<std::mutex> lock(m);
                      uptimes.push_back(s.uptime);
                  });

    bus.start();
    for (int i = 0; i < 100; ++i)
    {
        evtelemetry::TelemetrySnapshot s{};
        s.uptime = static_cast<double>(i);
        bus.publish(s);
    }

    const bool delivered = waitFor([&]
                                   {
                                       std::lock_guard<std::mutex> lock(m);
                                       return uptimes.size() == 100;
                                   },
                                   500ms);
    bus.stop();

    REQUIRE(delivered);
    for (std::size_t i = 0; i < uptimes.size(); ++i)
        REQUIRE(uptimes[i] == static_cast<double>(i));
}

TEST_CASE("CommunicationBus drops messages when configured for overflow", "[CommunicationBus]")
{
    evtelemetry::bus::BusConfig config;
    config.dropOnOverflow = true;
    config.maxQueueSizePerType = 1;
    evtelemetry::bus::CommunicationBus bus(config);

    std::atomic<int> handled{0};
    bus.subscribe([&](const evtelemetry::MotionSample &)
                  { handled++; });

    evtelemetry::MotionSample sample{};

    // Queue fills before the worker starts, later publishes should be dropped.
    bus.publish(sample);
    bus.publish(sample);
    bus.publish(sample);

    REQUIRE(bus.droppedMessages() == 2);

    bus.start();

    const bool singleDelivered = waitFor([&]
                                         { return handled.load() == 1; },
                                         200ms);
    bus.stop();

    REQUIRE(singleDelivered);
    REQUIRE(bus.droppedMessages() == 2);
}

TEST_CASE("CommunicationBus stop delivers messages already queued", "[CommunicationBus]")
{
    for (int run = 0; run < 50; ++run)
    {
        evtelemetry::bus::CommunicationBus bus;

        std::atomic<int> finishedEvents{0};
        std::atomic<int> snapshots{0};
        bus.subscribe([&](const evtelemetry::SystemEvent &e)
                      {
                          if (e.type == evtelemetry::SystemEventType::CollectionFinished)
                              finishedEvents++;
                      });
        bus.subscribe([&](const evtelemetry::TelemetrySnapshot &)
                      { snapshots++; });

        bus.start();

        bus.publish(evtelemetry::TelemetrySnapshot{});
        evtelemetry::SystemEvent evt{};
        evt.type = evtelemetry::SystemEventType::CollectionFinished;
        evt.description = "Collection complete. Collected 1 readings.";
        bus.publish(evt);

        // No wait: stop() itself must flush the queues.
        bus.stop();

        REQUIRE(snapshots.load() == 1);
        REQUIRE(finishedEvents.load() == 1);
    }
}

TEST_CASE("CommunicationBus start and stop are idempotent", "[CommunicationBus]")
{
    evtelemetry::bus::CommunicationBus bus;
    bus.stop();
    bus.start();
    bus.start();
    bus.stop();
    bus.stop();

    std::atomic<int> handled{0};
    bus.subscribe([&](const evtelemetry::SystemEvent &)
                  { handled++; });
    bus.start();
    bus.publish(evtelemetry::SystemEvent{});
    const bool delivered = waitFor([&]
                                   { return handled.load() == 1; },
                                   200ms);
    bus.stop();

    REQUIRE(delivered);
}

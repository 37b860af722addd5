#include <catch2/catch_test_macros.hpp>
#include <DataLogger/DataLogger.hpp>
#include <CommunicationBus/CommunicationBus.hpp>
#include <EvTelemetrySim/Messages.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace
{
    std::filesystem::path tempLogPath(const std::string &stem)
    {
        return std::filesystem::temp_directory_path() /
               (stem + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".log");
    }

    std::string readAll(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

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

TEST_CASE("DataLogger writes all enabled message types", "[DataLogger]")
{
    evtelemetry::bus::CommunicationBus bus;
    const auto tempPath = tempLogPath("evtelemetry_logger_enabled_");

    evtelemetry::logging::LoggerConfig cfg;
    cfg.outputPath = tempPath.string();

    evtelemetry::logging::DataLogger logger(cfg, bus);

    REQUIRE(logger.start());
    bus.start();

    evtelemetry::EnvironmentalSample env{};
    env.humidity = 50.0;
    bus.publish(env);

    evtelemetry::MotionSample motion{};
    motion.scenario = evtelemetry::ScenarioKind::Fall;
    bus.publish(motion);

    bus.publish(evtelemetry::TelemetrySnapshot{});

    evtelemetry::SystemEvent evt{};
    evt.description = "test-event";
    bus.publish(evt);

    const bool flushed = waitFor([&]
                                 { return logger.recordsWritten() == 4; },
                                 200ms);

    bus.stop();
    logger.stop();

    REQUIRE(flushed);

    const std::string contents = readAll(tempPath);
    REQUIRE(contents.find("[EnvironmentalSample] {\"kind\":\"environment\"") != std::string::npos);
    REQUIRE(contents.find("[MotionSample] {\"kind\":\"motion\"") != std::string::npos);
    REQUIRE(contents.find("\"scenario\":\"fall\"") != std::string::npos);
    REQUIRE(contents.find("[TelemetrySnapshot] {\"kind\":\"telemetry\"") != std::string::npos);
    REQUIRE(contents.find("[SystemEvent]") != std::string::npos);
    REQUIRE(contents.find("test-event") != std::string::npos);

    std::filesystem::remove(tempPath);
}

TEST_CASE("DataLogger respects disabled logging flags", "[DataLogger]")
{
    evtelemetry::bus::CommunicationBus bus;
    const auto tempPath = tempLogPath("evtelemetry_logger_disabled_");

    evtelemetry::logging::LoggerConfig cfg;
    cfg.outputPath = tempPath.string();
    cfg.logEnvironmentSamples = false;
    cfg.logMotionSamples = false;
    cfg.logTelemetry = false;
    cfg.logSystemEvents = true;

    evtelemetry::logging::DataLogger logger(cfg, bus);

    REQUIRE(logger.start());
    bus.start();

    bus.publish(evtelemetry::EnvironmentalSample{});
    bus.publish(evtelemetry::MotionSample{});
    bus.publish(evtelemetry::TelemetrySnapshot{});
    bus.publish(evtelemetry::SystemEvent{});

    const bool flushed = waitFor([&]
                                 { return logger.recordsWritten() == 1; },
                                 200ms);
    std::this_thread::sleep_for(20ms);

    bus.stop();
    logger.stop();

    REQUIRE(flushed);
    REQUIRE(logger.recordsWritten() == 1);

    const std::string contents = readAll(tempPath);
    REQUIRE(contents.find("[SystemEvent]") != std::string::npos);
    REQUIRE(contents.find("[EnvironmentalSample]") == std::string::npos);
    REQUIRE(contents.find("[MotionSample]") == std::string::npos);
    REQUIRE(contents.find("[TelemetrySnapshot]") == std::string::npos);

    std::filesystem::remove(tempPath);
}

TEST_CASE("DataLogger ignores traffic while stopped", "[DataLogger]")
{
    evtelemetry::bus::CommunicationBus bus;
    const auto tempPath = tempLogPath("evtelemetry_logger_stopped_");

    evtelemetry::logging::LoggerConfig cfg;
    cfg.outputPath = tempPath.string();
    evtelemetry::logging::DataLogger logger(cfg, bus);

    REQUIRE(logger.start());
    logger.stop();

    bus.start();
    bus.publish(evtelemetry::SystemEvent{});
    std::this_thread::sleep_for(30ms);
    bus.stop();

    REQUIRE(logger.recordsWritten() == 0);
    REQUIRE(readAll(tempPath).empty());

    std::filesystem::remove(tempPath);
}

TEST_CASE("DataLogger reports an unwritable output path", "[DataLogger]")
{
    evtelemetry::bus::CommunicationBus bus;

    evtelemetry::logging::LoggerConfig cfg;
    cfg.outputPath = (std::filesystem::temp_directory_path() / "evtelemetry_missing_dir" / "nested" / "out.log").string();
    evtelemetry::logging::DataLogger logger(cfg, bus);

    REQUIRE_FALSE(logger.start());
    REQUIRE(logger.recordsWritten() == 0);
}

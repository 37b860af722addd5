#include <CommunicationBus/CommunicationBus.hpp>
#include <DataLogger/DataLogger.hpp>
#include <EnvironmentalSensor/EnvironmentalSensorSimulator.hpp>
#include <InertialSensor/InertialSensorSimulator.hpp>
#include <RandomSource/RandomSource.hpp>
#include <ScooterModel/BatterySimulator.hpp>
#include <ScooterModel/MotorSimulator.hpp>
#include <ScooterModel/ThermalSimulator.hpp>
#include <SensorCollector/SensorCollector.hpp>
#include <Telemetry/TelemetryAggregator.hpp>
#include <VirtualTime/SteadyClock.hpp>
#include <chrono>
#include <ctime>
#include <iostream>
#include <thread>

using namespace evtelemetry;

int main()
{
    time::SteadyClock clock;
    random::MersenneRandomSource rng;
    bus::CommunicationBus bus;

    // BME680 set up the way the rig's collector configures it
    environment::EnvironmentalConfig envCfg;
    envCfg.humidityOversampling = environment::Oversampling::X2;
    envCfg.pressureOversampling = environment::Oversampling::X4;
    envCfg.temperatureOversampling = environment::Oversampling::X8;
    envCfg.filterSize = environment::FilterSize::Size3;
    envCfg.gasMeasurementEnabled = true;
    envCfg.gasHeaterTemperature = 320; // degC
    envCfg.gasHeaterDuration = 150;    // ms
    envCfg.gasHeaterProfile = 0;

    const std::time_t wallNow = std::time(nullptr);
    envCfg.initialTimeOfDayHours = static_cast<double>(wallNow % 86400) / 3600.0;

    inertial::InertialConfig imuCfg;
    imuCfg.schedule.minIntervalSec = 5.0; // denser events for the demo
    imuCfg.schedule.maxIntervalSec = 15.0;

    // Modules
    environment::EnvironmentalSensorSimulator environmental(envCfg, clock, rng);
    inertial::InertialSensorSimulator inertialSensor(imuCfg, clock, rng);

    scooter::MotorSimulator motor(scooter::MotorConfig{}, clock, rng);
    scooter::BatterySimulator battery(scooter::BatteryConfig{}, motor, clock);
    scooter::ThermalSimulator thermal(scooter::ThermalConfig{}, motor, clock, rng);
    telemetry::TelemetryAggregator aggregator(battery, motor, thermal, clock);
    motor.setTargetSpeed(20.0);

    logging::LoggerConfig logCfg;
    logCfg.outputPath = "ev_telemetry.log";
    logging::DataLogger logger(logCfg, bus);

    collector::CollectorConfig collectCfg;
    collectCfg.collectionInterval = std::chrono::milliseconds(100);
    collectCfg.duration = std::chrono::seconds(30);

    collector::CollectorSources sources;
    sources.environment = &environmental;
    sources.inertial = &inertialSensor;
    sources.telemetry = &aggregator;

    collector::SensorCollector sensorCollector(collectCfg, sources, clock, bus);

    if (!logger.start())
        return 1;

    bus.start();
    sensorCollector.start();

    while (!sensorCollector.finished())
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

    sensorCollector.stop();
    bus.stop();
    logger.stop();

    std::cout << "[main] " << logger.recordsWritten() << " records written to " << logCfg.outputPath << "\n";
}

#pragma once

#include <EvTelemetrySim/Messages.hpp>
#include <RandomSource/RandomSource.hpp>
#include <VirtualTime/TimeSource.hpp>

namespace evtelemetry::environment
{
    enum class Oversampling
    {
        None,
        X1,
        X2,
        X4,
        X8,
        X16
    };

    enum class FilterSize
    {
        Size0,
        Size1,
        Size3,
        Size7,
        Size15,
        Size31,
        Size63,
        Size127
    };

    // Mirrors the BME680 driver settings. Only the gas heater values change the output,
    // through the heat_stable gate; the rest is recorded for callers that inspect it.
    struct EnvironmentalConfig
    {
        Oversampling humidityOversampling = Oversampling::X1;
        Oversampling pressureOversampling = Oversampling::X1;
        Oversampling temperatureOversampling = Oversampling::X1;
        FilterSize filterSize = FilterSize::Size0;

        bool gasMeasurementEnabled = false;
        int gasHeaterTemperature = 0; // degC
        int gasHeaterDuration = 0;    // ms
        int gasHeaterProfile = 0;

        double initialTimeOfDayHours = 0.0; // [0, 24)
    };

    /// Synthetic temperature/pressure/humidity/gas sensor.
    ///
    /// Each sample advances a 24h time-of-day clock and three bounded random-walk trends by
    /// the elapsed time since the previous sample. Temperature follows a daily sine peaking
    /// at 14:00, humidity moves against it, and gas resistance drops with humidity and during
    /// the 8:00 and 18:00 rush hours.
    ///
    /// Not thread-safe: a single owner must serialize calls.
    class EnvironmentalSensorSimulator
    {
    public:
        EnvironmentalSensorSimulator(const EnvironmentalConfig &config,
                                     time::TimeSource &clock,
                                     random::RandomSource &rng);

        /// Samples using the time elapsed on the clock since the previous call.
        EnvironmentalSample sample();

        /// Samples after an explicit step of elapsedSeconds (negative steps count as zero).
        EnvironmentalSample sample(double elapsedSeconds);

        void setHumidityOversampling(Oversampling value) noexcept { m_config.humidityOversampling = value; }
        void setPressureOversampling(Oversampling value) noexcept { m_config.pressureOversampling = value; }
        void setTemperatureOversampling(Oversampling value) noexcept { m_config.temperatureOversampling = value; }
        void setFilterSize(FilterSize value) noexcept { m_config.filterSize = value; }
        void setGasMeasurementEnabled(bool enabled) noexcept { m_config.gasMeasurementEnabled = enabled; }
        void setGasHeaterTemperature(int degC) noexcept { m_config.gasHeaterTemperature = degC; }
        void setGasHeaterDuration(int ms) noexcept { m_config.gasHeaterDuration = ms; }
        void selectGasHeaterProfile(int profile) noexcept { m_config.gasHeaterProfile = profile; }

        [[nodiscard]] const EnvironmentalConfig &config() const noexcept { return m_config; }
        [[nodiscard]] double timeOfDayHours() const noexcept { return m_timeOfDayHours; }
        [[nodiscard]] double temperatureTrend() const noexcept { return m_temperatureTrend; }
        [[nodiscard]] double pressureTrend() const noexcept { return m_pressureTrend; }
        [[nodiscard]] double humidityTrend() const noexcept { return m_humidityTrend; }

    private:
        [[nodiscard]] bool heaterIsStable() const noexcept;

        EnvironmentalConfig m_config;
        time::TimeSource &m_clock;
        random::RandomSource &m_rng;

        time::TimeSource::TimePoint m_lastUpdate{};
        double m_timeOfDayHours{0.0};

        double m_temperatureTrend{0.0};
        double m_pressureTrend{0.0};
        double m_humidityTrend{0.0};
    };
} // namespace evtelemetry::environment

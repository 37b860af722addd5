#include <EnvironmentalSensor/EnvironmentalSensorSimulator.hpp>

#include <algorithm>
#include <cmath>

namespace evtelemetry::environment
{
    namespace
    {
        constexpr double kPi = 3.14159265358979323846;
        constexpr double kHoursPerDay = 24.0;

        constexpr double kBaseTemperature = 25.0;     // degC
        constexpr double kDailyTemperatureSwing = 5.0;
        constexpr double kTemperatureTrendLimit = 2.0;

        constexpr double kBasePressure = 1013.25; // hPa
        constexpr double kPressureTrendLimit = 10.0;

        constexpr double kBaseHumidity = 50.0; // %RH
        constexpr double kDailyHumiditySwing = 10.0;
        constexpr double kHumidityTrendLimit = 20.0;

        constexpr double kBaseGasResistance = 50000.0; // Ohm
        constexpr double kMinGasResistance = 5000.0;
        constexpr double kRushHourFactor = 0.7;
        constexpr double kMorningRushHour = 8.0;
        constexpr double kEveningRushHour = 18.0;
        constexpr double kRushHourHalfWidth = 2.0;

        constexpr int kStableHeaterTemperature = 200; // degC
        constexpr int kStableHeaterDuration = 100;    // ms
    } // namespace

    EnvironmentalSensorSimulator::EnvironmentalSensorSimulator(const EnvironmentalConfig &config,
                                                               time::TimeSource &clock,
                                                               random::RandomSource &rng)
        : m_config(config), m_clock(clock), m_rng(rng)
    {
        m_lastUpdate = m_clock.now();

        m_timeOfDayHours = std::fmod(config.initialTimeOfDayHours, kHoursPerDay);
        if (m_timeOfDayHours < 0.0)
            m_timeOfDayHours += kHoursPerDay;
    }

    EnvironmentalSample EnvironmentalSensorSimulator::sample()
    {
        const auto now = m_clock.now();
        const double elapsed = time::elapsedSeconds(m_lastUpdate, now);
        m_lastUpdate = now;

        return sample(elapsed);
    }

    EnvironmentalSample EnvironmentalSensorSimulator::sample(double elapsedSeconds)
    {
        const double elapsed = std::max(0.0, elapsedSeconds);

        m_timeOfDayHours = std::fmod(m_timeOfDayHours + elapsed / 3600.0, kHoursPerDay);

        // Daily phase: temperature peaks at 14:00 and bottoms out at 02:00.
        const double dailyPhase = std::sin(((m_timeOfDayHours - 8.0) / kHoursPerDay) * 2.0 * kPi);

        EnvironmentalSample out{};
        out.timestamp = m_clock.now();

        // Temperature
        const double previousTemperatureTrend = m_temperatureTrend;
        m_temperatureTrend = std::clamp(m_temperatureTrend + m_rng.uniform(-0.05, 0.05) * elapsed,
                                        -kTemperatureTrendLimit, kTemperatureTrendLimit);
        out.temperature = kBaseTemperature + m_temperatureTrend + kDailyTemperatureSwing * dailyPhase +
                          m_rng.uniform(-0.15, 0.15);

        // Pressure falls as the temperature trend rises.
        const double temperatureTrendDelta = m_temperatureTrend - previousTemperatureTrend;
        m_pressureTrend = std::clamp(m_pressureTrend - 0.5 * temperatureTrendDelta + m_rng.uniform(-0.25, 0.25) * elapsed,
                                     -kPressureTrendLimit, kPressureTrendLimit);
        out.pressure = kBasePressure + m_pressureTrend + m_rng.uniform(-0.25, 0.25);

        // Humidity runs opposite to the daily temperature cycle.
        m_humidityTrend = std::clamp(m_humidityTrend + m_rng.uniform(-0.25, 0.25) * elapsed,
                                     -kHumidityTrendLimit, kHumidityTrendLimit);
        out.humidity = std::clamp(kBaseHumidity + m_humidityTrend - kDailyHumiditySwing * dailyPhase + m_rng.uniform(-1.0, 1.0),
                                  0.0, 100.0);

        if (!m_config.gasMeasurementEnabled)
        {
            out.heat_stable = false;
            return out;
        }

        const double humidityFactor = 1.0 - out.humidity / 150.0;

        const bool morningRush = std::abs(m_timeOfDayHours - kMorningRushHour) < kRushHourHalfWidth;
        const bool eveningRush = std::abs(m_timeOfDayHours - kEveningRushHour) < kRushHourHalfWidth;
        const double rushHourFactor = (morningRush || eveningRush) ? kRushHourFactor : 1.0;

        // Noise is biased upward: [-0.3, 0.7) * 10 kOhm.
        const double resistance = kBaseGasResistance * humidityFactor * rushHourFactor + m_rng.uniform(-3000.0, 7000.0);

        out.heat_stable = heaterIsStable();
        if (out.heat_stable)
            out.gas_resistance = std::max(kMinGasResistance, resistance);

        return out;
    }

    bool EnvironmentalSensorSimulator::heaterIsStable() const noexcept
    {
        return m_config.gasHeaterTemperature > kStableHeaterTemperature &&
               m_config.gasHeaterDuration > kStableHeaterDuration;
    }
} // namespace evtelemetry::environment

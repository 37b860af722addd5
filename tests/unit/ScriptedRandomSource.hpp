#pragma once

#include <RandomSource/RandomSource.hpp>
#include <cstddef>
#include <utility>
#include <vector>

namespace evtelemetry::testing
{
    // Every draw returns lo + f * (hi - lo), with f cycling through the script.
    // A single fraction pins every noise term to the same relative position.
    class ScriptedRandomSource : public random::RandomSource
    {
    public:
        explicit ScriptedRandomSource(double fraction = 0.5) : m_script{fraction} {}
        explicit ScriptedRandomSource(std::vector<double> script) : m_script(std::move(script)) {}

        double uniform(double lo, double hi) override
        {
            const double f = m_script[m_draws % m_script.size()];
            ++m_draws;
            return lo + f * (hi - lo);
        }

        [[nodiscard]] std::size_t draws() const noexcept { return m_draws; }

    private:
        std::vector<double> m_script;
        std::size_t m_draws{0};
    };
} // namespace evtelemetry::testing

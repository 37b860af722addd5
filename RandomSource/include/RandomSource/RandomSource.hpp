#pragma once

#include <cstdint>
#include <random>

namespace evtelemetry::random
{
    /// Pluggable randomness for the simulators. Every noise term and scheduling decision
    /// is drawn through this interface so tests can seed or script the sequence.
    class RandomSource
    {
    public:
        virtual ~RandomSource() = default;

        /// Uniform draw in [lo, hi).
        virtual double uniform(double lo, double hi) = 0;

        /// True with probability p.
        bool chance(double p)
        {
            return uniform(0.0, 1.0) < p;
        }
    };

    // Mersenne Twister backed source. Equal seeds give equal sequences.
    class MersenneRandomSource : public RandomSource
    {
    public:
        explicit MersenneRandomSource(std::uint32_t seed);

        // Seeds from std::random_device for live runs.
        MersenneRandomSource();

        double uniform(double lo, double hi) override;

    private:
        std::mt19937 m_rng;
    };
} // namespace evtelemetry::random

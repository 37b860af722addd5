#include <RandomSource/RandomSource.hpp>

namespace evtelemetry::random
{
    MersenneRandomSource::MersenneRandomSource(std::uint32_t seed) : m_rng(seed) {}

    MersenneRandomSource::MersenneRandomSource() : m_rng(std::random_device{}()) {}

    double MersenneRandomSource::uniform(double lo, double hi)
    {
        if (hi <= lo)
            return lo;

        std::uniform_real_distribution<double> dist(lo, hi);
        return dist(m_rng);
    }
} // namespace evtelemetry::random

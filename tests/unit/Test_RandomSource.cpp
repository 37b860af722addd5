#include <catch2/catch_test_macros.hpp>
#include <RandomSource/RandomSource.hpp>

#include <vector>

using evtelemetry::random::MersenneRandomSource;

TEST_CASE("MersenneRandomSource replays identical sequences for equal seeds", "[RandomSource]")
{
    MersenneRandomSource a(1234);
    MersenneRandomSource b(1234);
    MersenneRandomSource c(4321);

    std::vector<double> seqA, seqB, seqC;
    for (int i = 0; i < 100; ++i)
    {
        seqA.push_back(a.uniform(-1.0, 1.0));
        seqB.push_back(b.uniform(-1.0, 1.0));
        seqC.push_back(c.uniform(-1.0, 1.0));
    }

    REQUIRE(seqA == seqB);
    REQUIRE(seqA != seqC);
}

TEST_CASE("MersenneRandomSource draws stay inside the requested range", "[RandomSource]")
{
    MersenneRandomSource rng(7);

    for (int i = 0; i < 10000; ++i)
    {
        const double v = rng.uniform(20.0, 60.0);
        REQUIRE(v >= 20.0);
        REQUIRE(v < 60.0);
    }

    REQUIRE(rng.uniform(5.0, 5.0) == 5.0);
}

TEST_CASE("chance follows the requested probability", "[RandomSource]")
{
    MersenneRandomSource rng(99);

    int hits = 0;
    constexpr int trials = 20000;
    for (int i = 0; i < trials; ++i)
    {
        if (rng.chance(0.05))
            ++hits;
    }

    const double fraction = static_cast<double>(hits) / trials;
    REQUIRE(fraction > 0.04);
    REQUIRE(fraction < 0.06);

    REQUIRE_FALSE(rng.chance(0.0));
}

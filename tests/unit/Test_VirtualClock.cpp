#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <VirtualTime/SteadyClock.hpp>
#include <VirtualTime/VirtualClock.hpp>

using evtelemetry::time::VirtualClock;
using namespace std::chrono_literals;
using Catch::Approx;

TEST_CASE("VirtualClock maintains a deterministic virtual timeline", "[VirtualClock]")
{
    VirtualClock clock;

    SECTION("starts at the epoch and does not regress")
    {
        auto t1 = clock.now();
        auto t2 = clock.now();
        REQUIRE(t1 == VirtualClock::TimePoint{});
        REQUIRE(t2 == t1);
    }

    SECTION("advances forward while ignoring negative deltas")
    {
        clock.advance(10ms);
        auto afterPositive = clock.now();
        REQUIRE(afterPositive - VirtualClock::TimePoint{} == 10ms);

        clock.advance(-5ms);
        REQUIRE(clock.now() == afterPositive);

        clock.advanceSeconds(-1.0);
        REQUIRE(clock.now() == afterPositive);
    }

    SECTION("advances by fractional seconds")
    {
        clock.advanceSeconds(1.5);
        REQUIRE(clock.now() - VirtualClock::TimePoint{} == 1500ms);
    }

    SECTION("reset returns the clock to the initial epoch")
    {
        clock.advance(7ms);
        REQUIRE(clock.now() > VirtualClock::TimePoint{});
        clock.reset();
        REQUIRE(clock.now() == VirtualClock::TimePoint{});
    }
}

TEST_CASE("elapsedSeconds collapses negative spans to zero", "[VirtualClock]")
{
    VirtualClock clock;
    const auto t0 = clock.now();
    clock.advance(3600s);
    const auto t1 = clock.now();

    REQUIRE(evtelemetry::time::elapsedSeconds(t0, t1) == 3600.0);
    REQUIRE(evtelemetry::time::elapsedSeconds(t1, t0) == 0.0);
}

TEST_CASE("SteadyClock is monotonic", "[VirtualClock]")
{
    evtelemetry::time::SteadyClock clock;
    const evtelemetry::time::TimeSource &source = clock;

    const auto a = source.now();
    const auto b = source.now();
    REQUIRE(b >= a);
}

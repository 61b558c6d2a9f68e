#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "core/ProgressStream.h"

#include <thread>
#include <vector>

using namespace segue;
using Catch::Matchers::WithinAbs;

TEST_CASE("TransitionProgress progress is elapsed over duration, capped at 1")
{
    TransitionProgress p{TransitionProgress::Phase::fading, 10.0, 3.0};
    CHECK_THAT(p.progress(), WithinAbs(0.3, 1e-12));
    CHECK(p.isActive());

    p.elapsed = 12.0;
    CHECK(p.progress() == 1.0);

    TransitionProgress idle;
    CHECK(idle.progress() == 0.0);
    CHECK_FALSE(idle.isActive());
}

TEST_CASE("ProgressStream delivers pushed events then ends on close")
{
    ProgressStream stream;
    REQUIRE(stream.push({TransitionProgress::Phase::fading, 1.0, 0.5}));
    REQUIRE(stream.push({TransitionProgress::Phase::fading, 1.0, 1.0}));
    stream.close();

    TransitionProgress out;
    REQUIRE(stream.next(out));
    CHECK(out.elapsed == 0.5);
    REQUIRE(stream.next(out));
    CHECK(out.elapsed == 1.0);
    CHECK_FALSE(stream.next(out));
}

TEST_CASE("ProgressStream rejects pushes after close")
{
    ProgressStream stream;
    stream.close();
    stream.close();
    CHECK(stream.isClosed());
    CHECK_FALSE(stream.push({TransitionProgress::Phase::fading, 1.0, 0.1}));
}

TEST_CASE("ProgressStream push fails when the ring is full")
{
    ProgressStream stream;
    for (int i = 0; i < ProgressStream::kCapacity; ++i)
        REQUIRE(stream.push({TransitionProgress::Phase::fading, 1.0, 0.0}));
    CHECK_FALSE(stream.push({TransitionProgress::Phase::fading, 1.0, 0.0}));
}

TEST_CASE("ProgressStream consumer blocks until the producer thread closes")
{
    ProgressStream stream;
    std::thread producer([&stream]
    {
        for (int i = 1; i <= 50; ++i)
        {
            stream.push({TransitionProgress::Phase::fading, 50.0, static_cast<double>(i)});
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
        stream.close();
    });

    std::vector<double> seen;
    TransitionProgress out;
    while (stream.next(out))
        seen.push_back(out.elapsed);
    producer.join();

    REQUIRE(seen.size() == 50);
    CHECK(seen.front() == 1.0);
    CHECK(seen.back() == 50.0);
}

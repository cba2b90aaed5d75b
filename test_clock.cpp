// Unit tests for pollUntil

#include <catch2/catch.hpp>

#include "clock.hpp"
#include "test_fakes.hpp"

using namespace page_recorder;
using page_recorder::testing::ManualTimeSource;

TEST_CASE("pollUntil returns the attempt that succeeded", "[clock]") {
    ManualTimeSource clock;
    RetryPolicy policy{10, Millis(1000)};
    std::vector<unsigned> seen;

    auto done = pollUntil(clock, policy, [&](unsigned attempt) {
        seen.push_back(attempt);
        return attempt == 3 ? PollStep::Done : PollStep::Continue;
    });

    REQUIRE(done.has_value());
    CHECK(*done == 3);
    CHECK(seen == std::vector<unsigned>{1, 2, 3});
    // Sleeps before every attempt, including the first
    CHECK(clock.elapsed() == Millis(3000));
}

TEST_CASE("pollUntil gives up after max_attempts", "[clock]") {
    ManualTimeSource clock;
    RetryPolicy policy{60, Millis(1000)};
    unsigned calls = 0;

    auto done = pollUntil(clock, policy, [&](unsigned) {
        ++calls;
        return PollStep::Continue;
    });

    CHECK_FALSE(done.has_value());
    CHECK(calls == 60);
    CHECK(clock.elapsed() == Millis(60000));
}

TEST_CASE("pollUntil lets probe exceptions through", "[clock]") {
    ManualTimeSource clock;
    RetryPolicy policy{5, Millis(10)};
    unsigned calls = 0;

    CHECK_THROWS_AS(pollUntil(clock, policy, [&](unsigned attempt) -> PollStep {
        ++calls;
        if (attempt == 2) throw std::runtime_error("host died");
        return PollStep::Continue;
    }), std::runtime_error);
    CHECK(calls == 2);
}

TEST_CASE("pollUntil with zero attempts never probes", "[clock]") {
    ManualTimeSource clock;
    bool called = false;
    auto done = pollUntil(clock, RetryPolicy{0, Millis(1000)}, [&](unsigned) {
        called = true;
        return PollStep::Done;
    });
    CHECK_FALSE(done);
    CHECK_FALSE(called);
}

TEST_CASE("SteadyTimeSource sleeps for real", "[clock]") {
    SteadyTimeSource clock;
    auto start = clock.now();
    clock.sleepFor(Millis(20));
    CHECK(clock.now() - start >= Millis(20));
}

// AsioScheduler with short real delays

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "scheduler.hpp"

using namespace page_recorder;

namespace {

template <class Pred>
bool waitFor(Pred pred, std::chrono::milliseconds limit = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace

TEST_CASE("scheduled tasks run after their delay", "[scheduler]") {
    AsioScheduler sched;
    std::atomic<int> runs{0};

    sched.schedule(Millis(20), "count", [&] { ++runs; });
    CHECK(sched.pending() == 1);

    CHECK(waitFor([&] { return runs.load() == 1; }));
    CHECK(waitFor([&] { return sched.pending() == 0; }));
}

TEST_CASE("cancelled tasks never run", "[scheduler]") {
    std::atomic<int> runs{0};
    {
        AsioScheduler sched;
        auto id = sched.schedule(Millis(50), "never", [&] { ++runs; });
        CHECK(sched.cancel(id));
        CHECK_FALSE(sched.cancel(id));
        CHECK(sched.pending() == 0);
        std::this_thread::sleep_for(Millis(120));
    }
    CHECK(runs == 0);
}

TEST_CASE("pending tasks run when the scheduler goes away", "[scheduler]") {
    std::atomic<int> runs{0};
    {
        AsioScheduler sched;
        sched.schedule(std::chrono::hours(1), "late", [&] { ++runs; });
    }
    CHECK(runs == 1);
}

TEST_CASE("a throwing task does not stop the scheduler", "[scheduler]") {
    AsioScheduler sched;
    std::atomic<int> runs{0};

    sched.schedule(Millis(5), "boom", [] { throw std::runtime_error("boom"); });
    sched.schedule(Millis(30), "after", [&] { ++runs; });

    CHECK(waitFor([&] { return runs.load() == 1; }));
}
